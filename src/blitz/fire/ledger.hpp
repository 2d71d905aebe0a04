#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace blitz {

/**
 * @brief Append-only record of fired prompts, one file per target URL.
 *
 * File names come from a lossy slug of the URL; two URLs with the same slug
 * share a record. Prior lines are never rewritten.
 */
class TargetLedger
{
public:
    explicit TargetLedger(std::filesystem::path dir);

    static std::string slug(std::string const& url);
    std::filesystem::path path_for(std::string const& url) const;

    /// Creates the record if missing; the header line is only written on creation.
    bool ensure_exists(std::string const& url, std::optional<std::string> const& header);

    bool append_round(std::string const& url, std::string const& line);

private:
    std::filesystem::path dir_;
};

} // namespace blitz
