#pragma once

#include <azlist/arm/resource.hpp>
#include <azlist/core/result.hpp>

#include <iostream>
#include <string>

namespace azlist {

// ---------------------------------------------------------------------------
// OutputFormatter: renders a listing result or a fatal error.
//
// Text mode prints an optional "Listing errors:" block, then one resource
// id per line, each optionally followed by its pretty-printed document.
// JSON mode prints one document:
//   {"resources":[{"id":...,"properties":{...}}],"errors":[{...}]}
// Fatal errors go to the error stream in both modes.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    void PrintResult(const ListResult& result, bool with_body, bool print_error) const;

    // Print a fatal error to the error stream.
    void PrintError(const Error& error) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

/// {"resources":[...],"errors":[...]}
nlohmann::json ResultToJson(const ListResult& result);

} // namespace azlist
