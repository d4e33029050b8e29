#ifndef NM_BACKPORT_H
#define NM_BACKPORT_H

#if defined(_WIN32)
#define NMBP_EXPORT __declspec(dllexport)
#else
#define NMBP_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
#define NMBP_NOEXCEPT noexcept
#else
#define NMBP_NOEXCEPT
#endif

/* Runs the installer; returns the process exit status */
NMBP_EXPORT int nmBackportMain(int argc, char *argv[], char *envp[]) NMBP_NOEXCEPT;

#endif
