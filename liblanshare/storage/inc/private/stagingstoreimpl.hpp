#ifndef LANSHARE_STORAGE_STAGINGSTOREIMPL_HPP_
#define LANSHARE_STORAGE_STAGINGSTOREIMPL_HPP_

#include <locale>
#include <map>
#include <mutex>

#include "stagingstore.hpp"

namespace lanshare::storage
{
/// One file per key inside a dedicated directory. Bytes are written to a temporary file first
/// and renamed into place, so a failed put never leaves a partial file behind.
class StagingStoreImpl : public StagingStore
{
public:
    StagingStoreImpl(std::string directory, std::string file_extension);
    ~StagingStoreImpl() override;

    bool                               put(const Key &key, const Bytes &bytes) override;
    [[nodiscard]] std::optional<Bytes> get(const Key &key) const override;
    bool                               remove(const Key &key) override;
    [[nodiscard]] bool                 contains(const Key &key) const override;
    void                               clear() override;

    [[nodiscard]] const std::string &directory() const;

private:
    [[nodiscard]] std::string file_path(const Key &key) const;
    [[nodiscard]] std::string temporary_file_path(const Key &key) const;

    const std::string          directory_;
    const std::string          file_extension_;
    const std::locale          default_locale_;
    const std::locale          time_format_locale_;
    std::map<Key, std::string> files_;
    mutable std::mutex         mutex_;
};
}  // namespace lanshare::storage

#endif  // LANSHARE_STORAGE_STAGINGSTOREIMPL_HPP_
