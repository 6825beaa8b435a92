#include "gulachek/vercompat/settings.hpp"

#include <gulachek/gtree.hpp>
#include <gulachek/gtree/encoding/string.hpp>

#include <gulachek/dictionary.hpp>

#include <string>

namespace gt = gulachek::gtree;

namespace gulachek::vercompat
{
	error load_compatibility(
			const std::filesystem::path &config,
			compatibility *out
			)
	{
		error err;
		using ec = settings_error_code;

		dictionary dict;
		if (auto rerr = gt::read_file(config, &dict))
		{
			auto wrap = rerr.wrap() << "Error reading config " << config;
			wrap.ucode(ec::no_config);
			return wrap;
		}

		std::string name;
		if (auto rerr = dict.read("version_compatibility", &name))
		{
			auto wrap = rerr.wrap() <<
				"Unable to read version_compatibility from config: " << config;
			wrap.ucode(ec::no_policy);
			return wrap;
		}

		auto compat = compatibility::from_name(name);
		if (!compat)
		{
			err.ucode(ec::unknown_policy);
			err << "Unknown version_compatibility '" << name << "' in " << config;
			return err;
		}

		*out = *compat;
		return {};
	}
}
