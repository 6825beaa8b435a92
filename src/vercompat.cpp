#include "vercompat.h"

#include "gulachek/vercompat/compatibility.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <optional>
#include <string>

using gulachek::vercompat::compatibility;
using gulachek::vercompat::ambiguous_policy;

// nothing may propagate out of the C interface
static void report(FILE *err, const std::exception &ex)
{
	if (err)
		std::fprintf(err, "vercompat: %s\n", ex.what());
}

static std::optional<compatibility> lookup(const char *policy, FILE *err)
{
	if (!policy)
	{
		if (err)
			std::fprintf(err, "vercompat: policy is NULL\n");

		return std::nullopt;
	}

	try
	{
		auto compat = compatibility::from_name(policy);
		if (!compat && err)
			std::fprintf(err, "vercompat: unknown policy '%s'\n", policy);

		return compat;
	}
	catch (const ambiguous_policy &ex)
	{
		std::fprintf(err ? err : stderr, "vercompat: %s\n", ex.what());
		std::exit(EXIT_FAILURE);
	}
}

int vercompat_is_compatible(const char *policy, const char *constraint,
		const char *version, FILE *err)
{
	auto compat = lookup(policy, err);
	if (!compat)
		return -1;

	if (!constraint || !version)
	{
		if (err)
			std::fprintf(err, "vercompat: constraint and version are required\n");

		return -1;
	}

	try
	{
		return compat->is_compatible(constraint, version) ? 1 : 0;
	}
	catch (const std::exception &ex)
	{
		report(err, ex);
		return -1;
	}
}

int vercompat_minimum_compatible_version(const char *policy,
		const char *version, char *buf, std::size_t bufsz, FILE *err)
{
	auto compat = lookup(policy, err);
	if (!compat)
		return -1;

	if (!version)
	{
		if (err)
			std::fprintf(err, "vercompat: version is required\n");

		return -1;
	}

	std::string min;
	try
	{
		min = compat->minimum_compatible_version(version);
	}
	catch (const std::exception &ex)
	{
		report(err, ex);
		return -1;
	}

	if (buf && bufsz > 0)
	{
		auto n = std::min(min.size(), bufsz - 1);
		std::memcpy(buf, min.data(), n);
		buf[n] = '\0';
	}

	return static_cast<int>(min.size());
}

const char *vercompat_policy_name(const char *policy)
{
	auto compat = lookup(policy, nullptr);
	if (!compat)
		return nullptr;

	// labels are string literals, so the view is null terminated
	return compat->name().data();
}
