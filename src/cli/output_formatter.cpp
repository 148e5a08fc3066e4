#include <azlist/cli/output_formatter.hpp>
#include <azlist/core/ansi.hpp>

namespace azlist {

nlohmann::json ResultToJson(const ListResult& result) {
    auto resources = nlohmann::json::array();
    for (const auto& resource : result.resources) {
        resources.push_back({
            {"id", resource.Id().String()},
            {"properties", resource.Properties()},
        });
    }
    auto errors = nlohmann::json::array();
    for (const auto& error : result.errors) {
        errors.push_back({
            {"endpoint", error.endpoint},
            {"api_version", error.api_version},
            {"message", error.message},
        });
    }
    return {{"resources", std::move(resources)}, {"errors", std::move(errors)}};
}

void OutputFormatter::PrintResult(const ListResult& result, bool with_body,
                                  bool print_error) const {
    if (json_mode_) {
        out_ << ResultToJson(result).dump(2) << "\n";
        return;
    }

    if (print_error && !result.errors.empty()) {
        out_ << "Listing errors:\n";
        for (const auto& error : result.errors) {
            out_ << "\t" << error.ToString() << "\n";
        }
        out_ << "\n";
    }

    for (const auto& resource : result.resources) {
        out_ << resource.Id().String() << "\n";
        if (with_body) {
            out_ << resource.Properties().dump(2) << "\n";
        }
    }
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        using namespace ansi;
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        if (error.http_status.has_value()) {
            err_ << kDim << " (HTTP " << error.http_status.value() << ")" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        if (!error.endpoint.empty()) {
            err_ << "  " << kDim << "Endpoint: " << kReset << error.endpoint << "\n";
        }
        if (error.arm_error.has_value() && !error.arm_error->empty()) {
            err_ << "  " << kDim << "ARM: " << kReset << error.arm_error.value() << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (error.http_status.has_value()) {
        err_ << " (HTTP " << error.http_status.value() << ")";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (!error.endpoint.empty()) {
        err_ << "  Endpoint: " << error.endpoint << "\n";
    }
    if (error.arm_error.has_value() && !error.arm_error->empty()) {
        err_ << "  ARM: " << error.arm_error.value() << "\n";
    }
}

} // namespace azlist
