/*

backup.cpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include "backup.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <utility>
#include <vector>
#include <unistd.h>
#include <stdlib.h>
#include <rendmail/detail/log.hpp>


namespace rendmail::cli
{


std::string backup_file::name_prefix(std::chrono::system_clock::time_point now)
{
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    if (ms.count() < 0)
        ms += std::chrono::seconds(1);
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::floor<std::chrono::seconds>(now));
    std::tm tm_buf{};
    gmtime_r(&tt, &tm_buf);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d-%02d%02d%02d.%03d", tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));
    return buf;
}


result<std::unique_ptr<backup_file>> backup_file::create(const std::filesystem::path& dir, std::chrono::system_clock::time_point now)
{
    std::string templ = (dir / (name_prefix(now) + "-XXXXXX")).string();
    std::vector<char> name(templ.begin(), templ.end());
    name.push_back('\0');

    int fd = ::mkstemp(name.data());
    if (fd < 0)
        return fail<std::unique_ptr<backup_file>>(error_code::backup_failed,
            "creating " + templ + " failed: " + std::strerror(errno));

    RENDMAIL_DEBUG("Backing up message to " + std::string(name.data()));
    return std::unique_ptr<backup_file>(new backup_file(fd, std::filesystem::path(name.data())));
}


backup_file::backup_file(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path))
{
}


backup_file::~backup_file()
{
    if (fd_ >= 0)
        ::close(fd_);
}


bool backup_file::write(std::string_view chunk)
{
    if (fd_ < 0)
        return false;

    while (!chunk.empty())
    {
        ssize_t written = ::write(fd_, chunk.data(), chunk.size());
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            RENDMAIL_ERROR("Failed writing message to " + path_.string() + ": " + std::strerror(errno));
            return false;
        }
        chunk.remove_prefix(static_cast<std::size_t>(written));
    }
    return true;
}


result_void backup_file::close()
{
    if (fd_ < 0)
        return ok();

    int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0)
        return fail(error_code::backup_failed, "closing " + path_.string() + " failed: " + std::strerror(errno));
    return ok();
}


} // namespace rendmail::cli
