#include "ledger.hpp"
#include "blitz/core/atomic_file.hpp"
#include "blitz/core/log.hpp"

namespace blitz {

TargetLedger::TargetLedger(std::filesystem::path dir)
    : dir_(std::move(dir))
{ }

std::string TargetLedger::slug(std::string const& url)
{
    std::string out;
    out.reserve(url.size());
    for (char c : url)
    {
        if (c == '?' || c == ':')
            continue;
        out += (c == '/') ? '_' : c;
    }
    if (out.empty())
        out = "_";
    return out;
}

std::filesystem::path TargetLedger::path_for(std::string const& url) const
{
    return dir_ / (slug(url) + ".ledger");
}

bool TargetLedger::ensure_exists(std::string const& url, std::optional<std::string> const& header)
{
    auto path = path_for(url);
    std::error_code ec;
    if (std::filesystem::exists(path, ec))
        return true;

    std::string contents = header ? *header + "\n" : std::string();
    if (!atomic_file::write(path, contents))
        return false;
    LOG_INFO("Created target record {}", path.string());
    return true;
}

bool TargetLedger::append_round(std::string const& url, std::string const& line)
{
    auto path = path_for(url);
    if (!atomic_file::append_line(path, line))
    {
        LOG_ERROR("Failed to append round to {}", path.string());
        return false;
    }
    return true;
}

} // namespace blitz
