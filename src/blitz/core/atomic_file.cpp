#include "atomic_file.hpp"
#include "blitz/core/log.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace blitz::atomic_file {

namespace {

bool write_all(int fd, std::string const& contents)
{
    size_t written = 0;
    while (written < contents.size())
    {
        ssize_t n = ::write(fd, contents.data() + written, contents.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

bool write(fs::path const& path, std::string const& contents)
{
    std::error_code ec;
    fs::path parent = path.parent_path();
    if (!parent.empty())
    {
        fs::create_directories(parent, ec);
        if (ec)
        {
            LOG_ERROR("Cannot create {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    std::string tmpl = (parent.empty() ? fs::path(".") : parent).string() + "/." + path.filename().string() + ".XXXXXX";
    std::vector<char> buffer(tmpl.begin(), tmpl.end());
    buffer.push_back('\0');

    int fd = mkstemp(buffer.data());
    if (fd < 0)
    {
        LOG_ERROR("Cannot create temporary file for {}: {}", path.string(), std::strerror(errno));
        return false;
    }
    fs::path tmp(buffer.data());

    bool ok = write_all(fd, contents) && ::fsync(fd) == 0;
    // mkstemp creates 0600; published files are plain user data
    ok = ok && ::fchmod(fd, 0644) == 0;
    if (::close(fd) != 0)
        ok = false;

    if (!ok)
    {
        LOG_ERROR("Failed writing temporary file for {}: {}", path.string(), std::strerror(errno));
        fs::remove(tmp, ec);
        return false;
    }

    fs::rename(tmp, path, ec);
    if (ec)
    {
        LOG_ERROR("Cannot rename {} over {}: {}", tmp.string(), path.string(), ec.message());
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

bool append_line(fs::path const& path, std::string const& line)
{
    std::string contents = read(path).value_or("");
    if (!contents.empty() && contents.back() != '\n')
        contents += '\n';
    contents += line;
    contents += '\n';
    return write(path, contents);
}

std::optional<std::string> read(fs::path const& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        return std::nullopt;

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace blitz::atomic_file
