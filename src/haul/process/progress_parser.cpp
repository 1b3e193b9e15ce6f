// Copyright (c) 2026 changcheng967. All rights reserved.

#include <haul/process/progress_parser.hpp>
#include <algorithm>
#include <cctype>

namespace haul::process {

namespace {

bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

} // namespace

std::optional<std::pair<std::string, std::string>>
parse_progress_line(std::string_view line) {
    line = trim(line);
    auto eq = line.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return std::nullopt;
    }

    auto key = trim(line.substr(0, eq));
    if (key.empty() || std::any_of(key.begin(), key.end(), is_space)) {
        return std::nullopt;
    }
    return std::pair{std::string(key), std::string(trim(line.substr(eq + 1)))};
}

ProgressParser::FeedResult ProgressParser::feed(std::string_view line) {
    FeedResult result;

    if (trim(line).empty()) {
        result.block = flush();
        return result;
    }

    auto kv = parse_progress_line(line);
    if (!kv) {
        ++skipped_;
        return result;
    }

    ++parsed_;
    result.parsed = true;
    const bool closes_block = kv->first == "progress";
    current_.insert_or_assign(std::move(kv->first), std::move(kv->second));
    if (closes_block) {
        result.block = flush();
    }
    return result;
}

std::optional<core::ProgressFields> ProgressParser::flush() {
    if (current_.empty()) {
        return std::nullopt;
    }
    auto block = std::move(current_);
    current_.clear();
    return block;
}

} // namespace haul::process
