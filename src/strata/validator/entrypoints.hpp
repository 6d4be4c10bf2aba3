#ifndef STRATA_VALIDATOR_ENTRYPOINTS_HPP
#define STRATA_VALIDATOR_ENTRYPOINTS_HPP
#include "../kernel/session.h"
#include "../policy/modules.h"
#include <regex>

namespace strata
{
	namespace entrypoints
	{
		int inspect(const inline_args& environment)
		{
			auto params = protocol(environment);
			auto* terminal = console::get();
			auto directory = *os::directory::get_working();
			auto provider = policy::schema_module_provider();
			error_handling::set_flag(log_option::dated, false);

			auto ok = [&](const std::string_view& line) -> bool { terminal->colorize(std_color::light_gray, line); terminal->write_char('\n'); return true; };
			auto err = [&](const std::string_view& line) -> bool { terminal->colorize(std_color::light_gray, line); terminal->write_char('\n'); return false; };
			auto decode_input = [&](const string& type_name, const string& hex, ledger::type_resolver& resolver, ledger::type_tag& type) -> expects_vm<ledger::value>
			{
				auto parsed = ledger::type_tag::from_string(type_name, params.limits.max_type_depth);
				if (!parsed)
					return parsed.error();

				type = std::move(*parsed);
				auto verification = resolver.verify_type(type);
				if (!verification)
					return verification.error();

				if (!format::util::is_hex_encoding(hex))
					return vm_exception::deserialization_error("input is not a hex string");

				ledger::value_codec codec(&resolver);
				return codec.decode(format::util::decode_0xhex(hex), type);
			};
			auto command_execute = [&](vector<string>& args, const std::string_view& directory) -> bool
			{
				if (args.empty())
					return true;

				auto& method = args[0];
				if (method == "modules")
				{
					if (args.size() < 2)
						return ok(stringify::text("%i modules loaded", (int)provider.size()));

					auto path = os::path::resolve(args[1], directory, true);
					if (!path)
						return err(path.what());

					auto count = provider.load_file(*path);
					if (!count)
						return err(count.error().what());

					return ok(stringify::text("%i modules loaded from %s", (int)*count, path->c_str()));
				}
				else if (method == "module")
				{
					if (args.size() < 2)
						return err("module id required (address::name)");

					auto parts = stringify::split(args[1], ':');
					if (parts.size() != 3 || !parts[1].empty())
						return err("not a valid module id");

					auto address = algorithm::encoding::decode_address(parts[0]);
					if (!address)
						return err("not a valid address");

					auto definition = provider.load_module(ledger::module_id(*address, parts[2]));
					if (!definition)
						return err(definition.error().what());

					uptr<schema> data = policy::schema_module_provider::serialize_module(*definition);
					terminal->jwrite_line(*data);
					return true;
				}
				else if (method == "type")
				{
					if (args.size() < 2)
						return err("type tag required");

					auto type = ledger::type_tag::from_string(args[1], params.limits.max_type_depth);
					if (!type)
						return err(type.error().what());

					ledger::type_resolver resolver(&provider);
					auto verification = resolver.verify_type(*type);
					if (!verification)
						return err(verification.error().what());

					auto abilities = resolver.abilities_of(*type);
					if (!abilities)
						return err(abilities.error().what());

					uptr<schema> data = var::set::object();
					data->set("type", var::string(type->to_string()));
					data->set("depth", var::integer(type->depth()));
					data->set("abilities", var::string(abilities->to_string()));
					terminal->jwrite_line(*data);
					return true;
				}
				else if (method == "decode" || method == "hash")
				{
					if (args.size() < 3)
						return err("type tag and hex input required");

					ledger::type_tag type;
					ledger::type_resolver resolver(&provider);
					auto value = decode_input(args[1], args[2], resolver, type);
					if (!value)
						return err(value.error().what());

					if (method == "hash")
					{
						ledger::value_codec codec(&resolver);
						auto digest = codec.hash(*value, type);
						if (!digest)
							return err(digest.error().what());

						return ok(format::util::encode_0xhex(digest->view()));
					}

					uptr<schema> data = value->as_schema();
					terminal->jwrite_line(*data);
					return true;
				}
				else if (method == "schedule")
				{
					uptr<schema> data = params.gas.schedule.as_schema();
					terminal->jwrite_line(*data);
					return true;
				}
				else if (method == "intrinsic")
				{
					if (args.size() < 2)
						return err("transaction size required");

					auto size = from_string<uint64_t>(args[1], 10);
					if (!size)
						return err("not a valid size");

					auto gas = ledger::gas_meter::calculate_intrinsic_gas(params.gas, *size);
					if (!gas)
						return err(gas.error().what());

					return ok(to_string(*gas));
				}
				else if (method == "clear")
				{
					terminal->clear();
					return true;
				}
				else if (method == "help")
				{
					ok(
						"------------- type and value inspector (strata) ------------\n"
						"This tool may be used to inspect module definitions, type\n"
						"tags and canonical value encodings without executing any\n"
						"transaction. Loaded modules stay in memory until exit.\n"
						"-------------------- inspector commands --------------------\n"
						"modules [path?]                                          -- load a module document (json) or show loaded module count\n"
						"module [address::name]                                   -- show a loaded module definition\n"
						"type [tag]                                               -- verify a type tag and show its depth and abilities\n"
						"decode [tag] [hex]                                       -- decode a canonical value of a type\n"
						"hash [tag] [hex]                                         -- decode a canonical value and show its hash\n"
						"schedule                                                 -- show the gas schedule\n"
						"intrinsic [size]                                         -- show the intrinsic gas of a transaction size\n"
						"clear                                                    -- clear console output\n"
						"---------------- environment functionality ----------------\n"
						"execp [path]                                             -- run predefined execution plan (json file of format: [[\"method\", args?...], ...])\n"
						"help                                                     -- show this message\n"
						"\n"
						"*********** configuration arguments applicable ***********");
					return true;
				}
				return err("command not found");
			};
			auto command_assemble = [&](string& command) -> bool
			{
				if (stringify::trim(command).empty())
					return true;

				vector<string> args;
				auto command_copy = copy<std::string>(command);
				static std::regex pattern("[^\\s\"\']+|\"([^\"]*)\"|\'([^\']*)'");
				for (auto it = std::sregex_iterator(command_copy.begin(), command_copy.end(), pattern); it != std::sregex_iterator(); ++it)
				{
					auto result = copy<string, std::string>(it->str());
					stringify::trim(result);
					if (result.size() >= 2 && result.front() == '\"' && result.back() == '\"')
						result = result.substr(1, result.size() - 2);
					if (!result.empty())
						args.push_back(std::move(result));
				}

				if (args.empty())
					return true;

				auto& method = args[0];
				if (method == "execp")
				{
					if (args.size() < 2)
						return err("not a valid path");

					auto path = os::path::resolve(args[1], directory, true);
					if (!path)
						return err(path.what());

					auto file = os::file::read_as_string(*path);
					if (!file)
						return err(file.what());

					auto possible_execp = schema::from_json(*file);
					if (!possible_execp)
						return err(possible_execp.what());

					auto execp = uptr<schema>(possible_execp);
					if (!execp->value.is(var_type::array))
						return err("not a valid array");

					auto path_directory = os::path::get_directory(*path);
					for (auto& subcommand : execp->get_childs())
					{
						vector<string> subargs;
						for (auto& subargument : subcommand->get_childs())
							subargs.push_back(subargument->value.get_blob());

						string compiled_command = "> ";
						for (auto& argument : subargs)
							compiled_command.append(argument).append(1, ' ');
						compiled_command.pop_back();

						ok(compiled_command);
						if (!command_execute(subargs, path_directory))
							return false;
					}
					return true;
				}
				return command_execute(args, directory);
			};

			auto execute = environment.args.find("command");
			if (execute == environment.args.end())
			{
				ok("type \"help\" for more information.");
				string command;
				while (true)
				{
					terminal->write("> ");
					if (!terminal->read_line(command, 1024))
						break;
					if (!command.empty())
						command_assemble(command);
				}
				return 0;
			}

			string command = execute->second;
			return command_assemble(command) ? 0 : 1;
		}
	}
}
#endif
