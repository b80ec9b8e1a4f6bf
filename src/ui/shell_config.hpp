#pragma once

#include <functional>
#include <string>

namespace kestrel
{

// Persistent shell tunables: timers, drag metrics, logging.  Stored as a
// small versioned JSON file; unknown keys are ignored and missing keys keep
// their defaults.
class ShellConfig
{
   public:
    static constexpr int CURRENT_VERSION = 1;

    struct Values
    {
        int         reconcile_delay_ms   = 50;     // debounce for state reconciliation
        int         poll_interval_ms     = 1000;   // fallback polling period
        float       drag_threshold_px    = 4.0f;
        float       default_cell_size    = 36.0f;
        float       default_cell_spacing = 2.0f;
        std::string log_level            = "info";
        bool        haptics_enabled      = true;
    };

    ShellConfig() = default;

    ShellConfig(const ShellConfig&)            = delete;
    ShellConfig& operator=(const ShellConfig&) = delete;

    const Values& values() const { return values_; }

    // Replace all values (clamped to sane ranges) and notify.
    void set_values(const Values& v);
    void reset_to_defaults();

    // Save to a JSON file.  Returns true on success.
    bool save(const std::string& path) const;

    // Load from a JSON file.  On failure the current values are kept.
    bool load(const std::string& path);

    // ~/.config/kestrel/shell.json
    static std::string default_path();

    std::string serialize() const;
    bool        deserialize(const std::string& json);

    using ChangeCallback = std::function<void(const Values&)>;
    void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

   private:
    static Values sanitize(Values v);
    void          notify_change();

    Values         values_;
    ChangeCallback on_change_;
};

}  // namespace kestrel
