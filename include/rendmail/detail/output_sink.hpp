#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace rendmail
{
namespace detail
{

/**
Destination for raw bytes. `write()` returns false once the destination failed.
**/
struct output_sink
{
    virtual ~output_sink() = default;
    virtual bool write(std::string_view chunk) = 0;
};

class string_sink : public output_sink
{
public:
    explicit string_sink(std::string& out) : out_(&out) {}

    bool write(std::string_view chunk) override
    {
        out_->append(chunk.data(), chunk.size());
        return true;
    }

private:
    std::string* out_;
};

class ostream_sink : public output_sink
{
public:
    explicit ostream_sink(std::ostream& out) : out_(&out) {}

    bool write(std::string_view chunk) override
    {
        out_->write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        return static_cast<bool>(*out_);
    }

private:
    std::ostream* out_;
};

} // namespace detail
} // namespace rendmail
