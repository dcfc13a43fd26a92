#include <cbor_inspector/cbor.hpp>
#include <cbor_inspector/cbor/json.hpp>
#include <cbor_inspector/exceptions.hpp>
#include <cbor_inspector/file_io.hpp>
#include <cbor_inspector/types.hpp>
#include <cbor_inspector/util.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <unistd.h>

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace cbi {

namespace {

constexpr std::string_view LOG_NAME = "cbor-inspect";

constexpr std::string_view USAGE =
    "Usage: cbor-inspect [--json] [--strict] [--lenient] [--max-depth N] [FILE]\n"
    "\n"
    "Decodes every CBOR item in FILE (or stdin when FILE is omitted or '-')\n"
    "and prints one item per line.\n"
    "\n"
    "  --json         print items as JSON instead of diagnostic text\n"
    "  --strict       reject integers and lengths not in their shortest form\n"
    "  --lenient      decode unassigned simple values as invalid items\n"
    "  --max-depth N  maximum nesting depth (default 128)\n"
    "\n"
    "Set CBOR_INSPECTOR_DEBUG to enable debug logging.\n";

struct inspect_arguments {
    bool show_help = false;
    bool json = false;
    decode_options options;
    std::optional<std::string> path;
};

size_t parse_max_depth(std::string_view str) {
    size_t value = 0;
    auto [end, error] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (error != std::errc{} || end != str.data() + str.size()) {
        throw usage_error(fmt::format("Invalid value '{}' for --max-depth", str));
    }

    return value;
}

inspect_arguments parse_arguments(int argc, char** argv) {
    inspect_arguments args;

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "--strict") {
            args.options.require_minimal_encoding = true;
        } else if (arg == "--lenient") {
            args.options.reserved_simple_values_as_invalid = true;
        } else if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                throw usage_error("--max-depth requires a value");
            }

            args.options.max_depth = parse_max_depth(argv[++i]);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw usage_error(fmt::format("Unknown option '{}'", arg));
        } else if (args.path) {
            throw usage_error("Only one input file may be given");
        } else if (arg != "-") {
            args.path = std::string(arg);
        }
    }

    return args;
}

}  // namespace

}  // namespace cbi

int main(int argc, char** argv) {
    using namespace cbi;

    set_up_logger(LOG_NAME);

    inspect_arguments args;
    try {
        args = parse_arguments(argc, argv);
    } catch (const usage_error& ex) {
        std::cerr << ex.what() << "\n\n" << USAGE;
        return 2;
    }

    if (args.show_help) {
        std::cout << USAGE;
        return 0;
    }

    byte_vector input;
    try {
        input = args.path ? read_file(*args.path) : read_all_from_fd(STDIN_FILENO);
    } catch (const std::system_error& ex) {
        spdlog::error("{}", ex.what());
        return 2;
    }

    if (spdlog::default_logger()->should_log(spdlog::level::debug)) {
        spdlog::debug("Read {} bytes of input:", input.size());
        log_multiline_binary(input, "  ");
    }

    try {
        std::vector<cbor_value> values = parse_cbor_sequence(input, args.options);

        for (auto&& value : values) {
            if (args.json) {
                std::cout << to_json(value).dump() << "\n";
            } else {
                std::cout << value.dump_debug() << "\n";
            }
        }
    } catch (const cbor_decode_error& ex) {
        spdlog::error("Failed to decode CBOR ({}): {}", to_string(ex.kind()), ex.what());
        return 1;
    }

    return 0;
}
