#ifndef GULACHEK_VERCOMPAT_SETTINGS_HPP
#define GULACHEK_VERCOMPAT_SETTINGS_HPP

#include "gulachek/vercompat/compatibility.hpp"

#include <gulachek/error.hpp>

#include <filesystem>

namespace gulachek::vercompat
{
	enum class settings_error_code
	{
		success,
		no_config,
		no_policy,
		unknown_policy
	};

	/**
	 * Read the "version_compatibility" entry of a gtree dictionary file
	 * @param config Path to the dictionary
	 * @param out Receives the policy on success
	 * @throws ambiguous_policy when the entry is "semver"
	 */
	VERCOMPAT_API error load_compatibility(
			const std::filesystem::path &config,
			compatibility *out
			);
}

#endif
