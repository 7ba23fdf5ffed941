#pragma once

#include <gradelib/stream.hh>
#include <string>
#include <string_view>

namespace gradelib::storage {

// Content-addressed blob store consumed by the sandboxes to materialize input
// files and to persist output files
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class Storage {
public:
    virtual ~Storage() = default;

    // Writes the whole blob identified by @p digest to @p dest. Throws
    // std::system_error (no_such_file_or_directory) if there is no such blob.
    virtual void get_file_to_stream(std::string_view digest, Stream& dest) = 0;

    // Stores everything readable from @p src as a new blob and returns its
    // digest
    virtual std::string put_file_from_stream(Stream& src, std::string_view description) = 0;
};

} // namespace gradelib::storage
