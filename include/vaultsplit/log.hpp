#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace vaultsplit::log {

enum class Level {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Off
};

// Lightweight handle passed to each component through its options. Copies
// share the same Boost.Log source; records below the handle's level are
// dropped before they reach the core.
class Logger {
public:
    // Quiet handle: every record is dropped.
    Logger();
    explicit Logger(std::string channel, Level min_level = Level::Info);

    Logger WithChannel(std::string channel) const;
    bool Enabled(Level level) const noexcept;

    void Trace(const std::string& message) const { Write(Level::Trace, message); }
    void Debug(const std::string& message) const { Write(Level::Debug, message); }
    void Info(const std::string& message) const { Write(Level::Info, message); }
    void Warn(const std::string& message) const { Write(Level::Warning, message); }
    void Error(const std::string& message) const { Write(Level::Error, message); }

private:
    struct Source;

    void Write(Level level, const std::string& message) const;

    std::string channel_;
    Level min_level_ = Level::Off;
    std::shared_ptr<Source> source_;
};

// Sinks are process-wide in Boost.Log; these install them once per target.
void InitConsole(Level level);
void InitFile(const std::string& path, Level level);

Level ParseLevel(std::string_view text, Level fallback = Level::Info);
std::string_view LevelName(Level level);

}  // namespace vaultsplit::log
