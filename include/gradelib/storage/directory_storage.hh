#pragma once

#include <gradelib/storage/storage.hh>
#include <string>
#include <string_view>

namespace gradelib::storage {

// Storage keeping blobs as files in a local directory. The digest is the
// SHA-1 of the content, the blob lives in <root>/<digest> and its
// description in <root>/<digest>.description.
class DirectoryStorage final : public Storage {
    std::string root_;

public:
    // @p root has to be an existing directory
    explicit DirectoryStorage(std::string root);

    void get_file_to_stream(std::string_view digest, Stream& dest) override;

    std::string put_file_from_stream(Stream& src, std::string_view description) override;

    [[nodiscard]] bool has_file(std::string_view digest) const;

    // Returns the description given when the blob was stored
    [[nodiscard]] std::string describe(std::string_view digest) const;

    [[nodiscard]] const std::string& root() const noexcept { return root_; }

    static bool is_valid_digest(std::string_view digest) noexcept;

    // Throws if @p digest is not valid
    [[nodiscard]] std::string blob_path(std::string_view digest) const;
};

} // namespace gradelib::storage
