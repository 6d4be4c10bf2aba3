#include "strata/validator/entrypoints.hpp"

using namespace strata;

int main(int argc, char* argv[])
{
	auto scope = vitex::runtime();
	auto environment = os::process::parse_args(argc, argv, (size_t)args_format::key | (size_t)args_format::key_value);
	return entrypoints::inspect(environment);
}
