#include "tollgate/cli.hpp"
#include "tollgate/config.hpp"
#include "tollgate/logging.hpp"
#include "tollgate/rate_limiter.hpp"
#include "tollgate/schema_translator.hpp"
#include <CLI/CLI.hpp>
#include <chrono>
#include <cmath>
#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <thread>

namespace tollgate::cli
{
	nlohmann::json admission_report(std::size_t call, bool admitted, const BucketInspector *inspector)
	{
		nlohmann::json line = {{"call", call}, {"admitted", admitted}};
		if (inspector)
		{
			line["remaining_calls"] = inspector->get_remaining_calls();
			double wait = inspector->get_time_to_next_call();
			line["time_to_next_call"] = std::isinf(wait) ? nlohmann::json(nullptr) : nlohmann::json(wait);
		}
		return line;
	}

	namespace
	{
		int report(const TollgateError &err)
		{
			std::cerr << error_code_to_string(err.code) << ": " << err.what() << std::endl;
			return 1;
		}

		int probe(TokenBucket &bucket, std::size_t calls, std::size_t interval_ms)
		{
			auto *inspector = dynamic_cast<const BucketInspector *>(&bucket);
			for (std::size_t i = 0; i < calls; ++i)
			{
				if (i > 0 && interval_ms > 0)
					std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));

				bool admitted = bucket.acquire();
				std::cout << admission_report(i + 1, admitted, inspector).dump() << std::endl;
			}
			return 0;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Tollgate token-bucket admission and tool-schema translation"};

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");
		cfg_cmd->add_option("--file", config_path, "Config path")->required();

		std::string tools_path;
		auto translate_cmd = app.add_subcommand("translate", "Translate MCP tool descriptors to function-calling schemas");
		translate_cmd->add_option("--file", tools_path, "Path to a tool, a tool array, or a tools/list result (JSON)")->required();

		std::string probe_limiter;
		std::string probe_kind{"per_second"};
		double probe_rate{1.0};
		std::size_t probe_calls{10};
		std::size_t probe_interval_ms{0};
		auto probe_cmd = app.add_subcommand("probe", "Drive a token bucket with acquire calls and print each result");
		probe_cmd->add_option("--limiter", probe_limiter, "Named limiter from --config");
		probe_cmd->add_option("--kind", probe_kind, "per_second, per_minute or calls_per_minute")
			->check(CLI::IsMember({"per_second", "per_minute", "calls_per_minute"}));
		probe_cmd->add_option("--rate", probe_rate, "Rate limit for an ad-hoc bucket");
		probe_cmd->add_option("--calls", probe_calls, "Number of acquire calls");
		probe_cmd->add_option("--interval-ms", probe_interval_ms, "Pause between calls in milliseconds");

		CLI11_PARSE(app, argc, argv);

		TollgateConfig runtime_cfg{};
		if (!config_path.empty())
		{
			auto cfg = ConfigLoader::load(config_path);
			if (!cfg)
				return report(cfg.error());
			runtime_cfg = *cfg;
		}
		if (auto ok = logging::init(runtime_cfg.logging); !ok)
			return report(ok.error());

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(runtime_cfg).dump(2) << std::endl;
			return 0;
		}

		if (*translate_cmd)
		{
			auto schemas = SchemaTranslator::translate_file(tools_path);
			if (!schemas)
				return report(schemas.error());
			spdlog::debug("translated {} tool(s) from {}", schemas->size(), tools_path);
			std::cout << schemas->dump(2) << std::endl;
			return 0;
		}

		if (*probe_cmd)
		{
			LimiterSpec spec;
			std::string name = "probe";
			if (!probe_limiter.empty())
			{
				auto it = runtime_cfg.limiters.find(probe_limiter);
				if (it == runtime_cfg.limiters.end())
					return report(TollgateError::config("Unknown limiter: " + probe_limiter));
				name = it->first;
				spec = it->second;
			}
			else
			{
				auto kind = limiter_kind_from_string(probe_kind);
				if (!kind)
					return report(kind.error());
				spec.kind = *kind;
				spec.rate = probe_rate;
			}

			auto bucket = make_limiter(name, spec);
			if (!bucket)
				return report(bucket.error());
			return probe(**bucket, probe_calls, probe_interval_ms);
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace tollgate::cli
