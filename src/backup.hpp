/*

backup.hpp
----------

Copy of the original message kept in a backup directory.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <rendmail/detail/output_sink.hpp>
#include <rendmail/detail/result.hpp>


namespace rendmail::cli
{


/**
New file with a unique name in the backup directory, written through the output sink interface.
**/
class backup_file : public detail::output_sink
{
public:

    /**
    Creating the file `<dir>/<yyyymmdd-hhmmss.mmm>-XXXXXX` where the time is in UTC and `XXXXXX` makes the name unique.

    @param dir Existing directory.
    @param now Time used in the name.
    @return    Opened file, or error `backup_failed`.
    **/
    static result<std::unique_ptr<backup_file>> create(const std::filesystem::path& dir, std::chrono::system_clock::time_point now);

    /**
    Name prefix of a backup file created at the given time.
    **/
    static std::string name_prefix(std::chrono::system_clock::time_point now);

    backup_file(const backup_file&) = delete;

    backup_file(backup_file&&) = delete;

    /**
    Closing the file if not done yet.
    **/
    ~backup_file() override;

    void operator=(const backup_file&) = delete;

    void operator=(backup_file&&) = delete;

    bool write(std::string_view chunk) override;

    /**
    Closing the file.

    @return Error `backup_failed` if closing failed.
    **/
    result_void close();

    const std::filesystem::path& path() const
    {
        return path_;
    }

private:

    backup_file(int fd, std::filesystem::path path);

    int fd_;

    std::filesystem::path path_;
};


} // namespace rendmail::cli
