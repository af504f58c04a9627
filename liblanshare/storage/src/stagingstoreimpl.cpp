#include "stagingstoreimpl.hpp"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include <boost/date_time.hpp>
#include <glog/logging.h>

#include "defer.hpp"

namespace lanshare::storage
{
namespace
{
constexpr char const *default_locale_name = "C";
constexpr char const *time_format_string  = "%Y%m%d.%H%M%S.%f";

/// Keys come from the network, so only letters, digits and '-' reach the file system as they are.
/// Every other byte, '_' included, becomes '_' followed by two hex digits, which keeps distinct
/// keys on distinct files.
std::string encode_key(const std::string &key)
{
    constexpr char const *hex_digits = "0123456789ABCDEF";

    std::string result;
    result.reserve(key.size());
    for (unsigned char c : key)
    {
        if (std::isalnum(c) || c == '-')
        {
            result.push_back(char(c));
        }
        else
        {
            result.push_back('_');
            result.push_back(hex_digits[c >> 4]);
            result.push_back(hex_digits[c & 0x0f]);
        }
    }
    return result;
}
}  // namespace

StagingStoreImpl::StagingStoreImpl(std::string directory, std::string file_extension)
    : directory_ {std::move(directory)}
    , file_extension_ {std::move(file_extension)}
    , default_locale_ {default_locale_name}
    , time_format_locale_ {default_locale_, new boost::posix_time::time_facet {time_format_string}}
{
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec)
    {
        LOG(ERROR) << "Cannot create directory " << directory_ << ": " << ec.message();
    }
}

StagingStoreImpl::~StagingStoreImpl()
{
    clear();
}

bool StagingStoreImpl::put(const Key &key, const Bytes &bytes)
{
    if (key.empty())
    {
        LOG(WARNING) << "Refusing to store bytes under an empty key";
        return false;
    }

    auto tmp_path   = temporary_file_path(key);
    auto final_path = file_path(key);

    {
        utils::Defer remove_tmp_file {[&tmp_path] {
            std::error_code ec;
            std::filesystem::remove(tmp_path, ec);
        }};

        std::ofstream fs {tmp_path, std::ios::binary | std::ios::trunc};
        if (!fs)
        {
            LOG(ERROR) << "Cannot open " << tmp_path << " for writing";
            return false;
        }
        fs.write(reinterpret_cast<const char *>(bytes.data()), std::streamsize(bytes.size()));
        fs.close();
        if (!fs)
        {
            LOG(ERROR) << "Writing " << bytes.size() << " bytes to " << tmp_path << " failed";
            return false;
        }

        std::error_code ec;
        std::filesystem::rename(tmp_path, final_path, ec);
        if (ec)
        {
            LOG(ERROR) << "Cannot move " << tmp_path << " to " << final_path << ": "
                       << ec.message();
            return false;
        }
        remove_tmp_file.dismiss();
    }

    std::lock_guard lock {mutex_};
    files_[key] = final_path;
    return true;
}

std::optional<StagingStore::Bytes> StagingStoreImpl::get(const Key &key) const
{
    std::string path;
    {
        std::lock_guard lock {mutex_};
        auto            it = files_.find(key);
        if (it == files_.end())
        {
            return std::nullopt;
        }
        path = it->second;
    }

    std::ifstream fs {path, std::ios::binary};
    if (!fs)
    {
        LOG(WARNING) << "Cannot open " << path << " for reading";
        return std::nullopt;
    }

    Bytes bytes {std::istreambuf_iterator<char> {fs}, std::istreambuf_iterator<char> {}};
    if (fs.bad())
    {
        LOG(ERROR) << "Reading " << path << " failed";
        return std::nullopt;
    }
    return bytes;
}

bool StagingStoreImpl::remove(const Key &key)
{
    std::string path;
    {
        std::lock_guard lock {mutex_};
        auto            it = files_.find(key);
        if (it == files_.end())
        {
            return false;
        }
        path = std::move(it->second);
        files_.erase(it);
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec)
    {
        LOG(WARNING) << "Cannot delete " << path << ": " << ec.message();
    }
    return true;
}

bool StagingStoreImpl::contains(const Key &key) const
{
    std::lock_guard lock {mutex_};
    return files_.count(key) != 0;
}

void StagingStoreImpl::clear()
{
    std::map<Key, std::string> files;
    {
        std::lock_guard lock {mutex_};
        files.swap(files_);
    }

    for (const auto &[key, path] : files)
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            LOG(WARNING) << "Cannot delete " << path << ": " << ec.message();
        }
    }
}

const std::string &StagingStoreImpl::directory() const
{
    return directory_;
}

std::string StagingStoreImpl::file_path(const Key &key) const
{
    return (std::filesystem::path {directory_} / (encode_key(key) + '.' + file_extension_))
        .string();
}

std::string StagingStoreImpl::temporary_file_path(const Key &key) const
{
    std::ostringstream ss;
    ss.imbue(time_format_locale_);
    ss << encode_key(key) << '.' << boost::posix_time::microsec_clock::local_time() << ".tmp";
    return (std::filesystem::path {directory_} / ss.str()).string();
}
}  // namespace lanshare::storage
