// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <surge/core/error.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace surge::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    [[nodiscard]] std::uint16_t default_port() const noexcept;

    // Last path segment, percent-decoded; "index.html" for directory URLs
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
};

// Decode %XX escapes; malformed escapes are kept verbatim
[[nodiscard]] std::string percent_decode(std::string_view text);

} // namespace surge::core
