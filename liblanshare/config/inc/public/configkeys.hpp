#ifndef LANSHARE_CONFIG_CONFIGKEYS_HPP_
#define LANSHARE_CONFIG_CONFIGKEYS_HPP_

#include <string>

namespace lanshare::config
{
class ConfigKey
{
public:
    enum EnumType
    {
        FIRST_KEY = 0,

        PORT = FIRST_KEY,
        DEVICE_NAME,
        SWEEP_PERIOD,
        PROBE_TIMEOUT,
        REAPER_PERIOD,
        LIVENESS_THRESHOLD,
        RETENTION_THRESHOLD,
        CONTROL_TIMEOUT,
        DATA_TIMEOUT,
        STAGING_DIR,
        INBOX_DIR,
        MAX_BODY_SIZE,
        SUBSCRIBER_QUEUE_SIZE,

        KEY_COUNT
    };

    /// Unknown names map to KEY_COUNT.
    explicit ConfigKey(const std::string &str_key);

    ConfigKey(EnumType k)
        : key_ {k}
    {}

    [[nodiscard]] std::string to_string() const
    {
        if (key_ >= 0 && key_ < KEY_COUNT)
        {
            return string_vals[key_];
        }
        return "";
    }

    [[nodiscard]] EnumType to_enum_type() const
    {
        return key_;
    }

    operator EnumType() const
    {
        return to_enum_type();
    }

    explicit operator std::string() const
    {
        return to_string();
    }

private:
    EnumType key_;

    static constexpr char const *string_vals[] {"port", "device_name", "sweep_period",
        "probe_timeout", "reaper_period", "liveness_threshold", "retention_threshold",
        "control_timeout", "data_timeout", "staging_dir", "inbox_dir", "max_body_size",
        "subscriber_queue_size"};

    static_assert(sizeof(string_vals) / sizeof(string_vals[0]) == KEY_COUNT);
};
}  // namespace lanshare::config

#endif  // LANSHARE_CONFIG_CONFIGKEYS_HPP_
