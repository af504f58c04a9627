#ifndef LANSHARE_STORAGE_STAGINGSTORE_HPP_
#define LANSHARE_STORAGE_STAGINGSTORE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lanshare::storage
{
/// Temporary byte storage addressed by transfer id.
class StagingStore
{
public:
    using Key   = std::string;
    using Bytes = std::vector<uint8_t>;

    virtual ~StagingStore() = default;

    /// Replaces any bytes already stored under the same key.
    virtual bool                               put(const Key &key, const Bytes &bytes) = 0;
    [[nodiscard]] virtual std::optional<Bytes> get(const Key &key) const               = 0;
    virtual bool                               remove(const Key &key)                  = 0;
    [[nodiscard]] virtual bool                 contains(const Key &key) const          = 0;
    virtual void                               clear()                                 = 0;
};
}  // namespace lanshare::storage

#endif  // LANSHARE_STORAGE_STAGINGSTORE_HPP_
