#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vertopal/vertopal.hpp>

using namespace vertopal;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <input> <output-format> [options]\n\n"
              << "Options:\n"
              << "  --input-format F     input format, detected by the service when omitted\n"
              << "  --output P           output file (default: <input stem>.<output-format>)\n"
              << "  --config FILE        JSON file with configuration overrides\n"
              << "  --app A --token T    API credential (default: api.app / api.token)\n"
              << "  --server-filename    name the output file as the service does\n"
              << "  --log-level L        trace, debug, info, warn, error, off\n";
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    std::string input = argv[1];
    std::string output_format = argv[2];
    std::optional<std::string> input_format;
    std::optional<std::string> output;
    std::optional<std::string> config_file;
    std::optional<std::string> app;
    std::optional<std::string> token;
    std::string log_level = "warn";
    bool server_filename = false;

    for (int i = 3; i < argc; ++i) {
        auto has_value = [&]() { return i + 1 < argc; };
        if (std::strcmp(argv[i], "--input-format") == 0 && has_value()) {
            input_format = argv[++i];
        } else if (std::strcmp(argv[i], "--output") == 0 && has_value()) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && has_value()) {
            config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--app") == 0 && has_value()) {
            app = argv[++i];
        } else if (std::strcmp(argv[i], "--token") == 0 && has_value()) {
            token = argv[++i];
        } else if (std::strcmp(argv[i], "--log-level") == 0 && has_value()) {
            log_level = argv[++i];
        } else if (std::strcmp(argv[i], "--server-filename") == 0) {
            server_filename = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    logging::enable();
    logging::set_log_level(logging::parse_level(log_level, spdlog::level::warn));

    try {
        auto& cfg = config::global();
        if (config_file) {
            cfg.load_file(*config_file);
            VERTOPAL_LOG("using configuration overrides from {}", *config_file);
        }
        if (app) cfg.set(settings::section::api, settings::key::app, *app);
        if (token) cfg.set(settings::section::api, settings::key::token, *token);

        auto format = util::canonicalize_format(output_format);
        if (!format) {
            std::cerr << "Output format must not be empty" << std::endl;
            return 1;
        }

        if (!output) {
            auto path = std::filesystem::path(input);
            output = (path.parent_path() / path.stem()).string() + "." + *format;
        }

        auto source = std::make_shared<io::file_input>(input);
        auto destination = std::make_shared<io::file_output>(*output);

        api::converter converter(std::nullopt, cfg);

        std::cout << "Converting " << input << " to " << *format << "..." << std::endl;
        auto conversion = converter.convert(source, destination, *format, input_format);

        conversion.wait(api::conversion::default_intervals(), [](std::chrono::milliseconds interval) {
            std::cout << "  still converting, checking again in "
                      << interval.count() / 1000.0 << "s" << std::endl;
            std::this_thread::sleep_for(interval);
        });

        if (!conversion.successful()) {
            std::cerr << "Conversion failed (status: "
                      << conversion.convert_status().value_or("unknown") << ")" << std::endl;
            return 2;
        }

        conversion.download(server_filename);

        std::cout << "Saved " << destination->path() << std::endl;
        if (auto credits = conversion.credits_used()) {
            std::cout << "vCredits used: " << *credits << std::endl;
        }
    } catch (const api_error& e) {
        std::cerr << "Error (" << to_string(e.kind()) << "): " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
