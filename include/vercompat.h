/**
 * Copyright 2025 Nicholas Gulachek
 *
 * Use of this source code is governed by an MIT-style
 * license that can be found in the LICENSE file or at
 * https://opensource.org/licenses/MIT.
 */
#ifndef VERCOMPAT_H
#define VERCOMPAT_H

#include <stddef.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

#ifndef VERCOMPAT_API
#define VERCOMPAT_API
#endif

/**
 * Test whether a version satisfies a constraint under a policy
 * @param policy Configuration name of the policy ("default", "always",
 * "strict", "early-semver", "semver-spec" or "pvp")
 * @param constraint The declared constraint (version, prefix or interval)
 * @param version The resolved version in question
 * @param err Optional stream for error messages to be written to
 * @returns 1 if compatible, 0 if not, -1 on error
 * @remarks "semver" is ambiguous and terminates the process with a message
 * written to err (stderr when err is NULL)
 */
int VERCOMPAT_API vercompat_is_compatible(const char *policy,
                                          const char *constraint,
                                          const char *version, FILE *err);

/**
 * Compute the lowest version a version is still compatible with
 * @param policy Configuration name of the policy
 * @param version The version in question
 * @param buf The preallocated buffer to hold the null terminated result. When
 * NULL, only compute string size in return value.
 * @param bufsz The size of buf in bytes. N/A when buf is NULL
 * @param err Optional stream for error messages to be written to
 * @returns The strlen() of the full result or -1 on error
 * @remarks When the return value is greater than or equal to bufsz, this means
 * the string was truncated, similar to snprintf.
 */
int VERCOMPAT_API vercompat_minimum_compatible_version(const char *policy,
                                                       const char *version,
                                                       char *buf, size_t bufsz,
                                                       FILE *err);

/**
 * Human readable label of a policy for diagnostics
 * @param policy Configuration name of the policy
 * @returns A static null terminated string, or NULL for an unknown policy
 * @remarks "semver" is ambiguous and terminates the process with a message
 * written to stderr
 */
const char *VERCOMPAT_API vercompat_policy_name(const char *policy);

#ifdef __cplusplus
}
#endif

#endif
