extern "C" {
#include "nm_backport.h"
}

// NOLINTNEXTLINE(*-avoid-c-arrays)
int main(int argc, char *argv[], char *envp[]) {
    return nmBackportMain(argc, argv, envp);
}
