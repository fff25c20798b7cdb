/**
 * @file structured_log.h
 * @brief Structured (machine-readable) log events on top of spdlog
 *
 * Events are emitted either as a single-line JSON object or as
 * key=value text, selected globally with StructuredLog::SetFormat().
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace mvdispatch::utils {

/**
 * @brief Log output format
 */
enum class LogFormat : std::uint8_t {
  JSON,  // {"event":"name","field":"value"}
  TEXT   // event=name field=value
};

/**
 * @brief Builder for one structured log event
 *
 * @code
 * StructuredLog()
 *     .Event("variant_resolved")
 *     .Field("function", "dot")
 *     .Field("level", "x86_64_v3")
 *     .Debug();
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  /**
   * @brief Set global log format
   * Thread-safe (relaxed atomic)
   */
  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }

  static LogFormat GetFormat() { return format_.load(std::memory_order_relaxed); }

  /**
   * @brief Map a config value to a format; anything but "text" is JSON
   */
  static LogFormat ParseFormat(const std::string& format_str) {
    if (format_str == "text") {
      return LogFormat::TEXT;
    }
    return LogFormat::JSON;
  }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return AddString(key, value); }
  StructuredLog& Field(const std::string& key, const std::string& value) { return AddString(key, value); }
  StructuredLog& Field(const std::string& key, std::string_view value) { return AddString(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, int64_t value) { return AddRaw(key, std::to_string(value)); }
  StructuredLog& Field(const std::string& key, uint64_t value) { return AddRaw(key, std::to_string(value)); }
  StructuredLog& Field(const std::string& key, int value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    return AddRaw(key, oss.str());
  }

  StructuredLog& Field(const std::string& key, bool value) { return AddRaw(key, value ? "true" : "false"); }

  void Error() { spdlog::error("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Debug() { spdlog::debug("{}", Build()); }
  void Critical() { spdlog::critical("{}", Build()); }

  /**
   * @brief Render the event in the current global format
   */
  std::string Build() const {
    if (GetFormat() == LogFormat::TEXT) {
      return BuildText();
    }
    return BuildJSON();
  }

 private:
  struct LogField {
    std::string key;
    std::string value;
    bool is_string;  ///< Quoted in JSON, escaped in text
  };

  StructuredLog& AddString(const std::string& key, std::string value) {
    fields_.push_back({key, std::move(value), true});
    return *this;
  }

  StructuredLog& AddRaw(const std::string& key, std::string value) {
    fields_.push_back({key, std::move(value), false});
    return *this;
  }

  std::string BuildJSON() const {
    std::ostringstream json;
    json << "{";
    bool first = true;
    auto separator = [&]() {
      if (!first) {
        json << ",";
      }
      first = false;
    };

    if (!event_.empty()) {
      separator();
      json << R"("event":")" << EscapeJSON(event_) << '"';
    }
    if (!message_.empty()) {
      separator();
      json << R"("message":")" << EscapeJSON(message_) << '"';
    }
    for (const auto& field : fields_) {
      separator();
      json << '"' << EscapeJSON(field.key) << "\":";
      if (field.is_string) {
        json << '"' << EscapeJSON(field.value) << '"';
      } else {
        json << field.value;
      }
    }
    json << "}";
    return json.str();
  }

  std::string BuildText() const {
    std::vector<std::string> parts;
    if (!event_.empty()) {
      parts.push_back("event=" + EscapeText(event_));
    }
    if (!message_.empty()) {
      parts.push_back("message=\"" + EscapeText(message_) + "\"");
    }
    for (const auto& field : fields_) {
      parts.push_back(field.is_string ? MakeTextField(field.key, field.value) : field.key + "=" + field.value);
    }

    std::string text;
    for (size_t i = 0; i < parts.size(); ++i) {
      if (i > 0) {
        text += ' ';
      }
      text += parts[i];
    }
    return text;
  }

  // Values with spaces, quotes or newlines (and empty values) are quoted
  static std::string MakeTextField(const std::string& key, const std::string& value) {
    if (value.empty() || value.find_first_of(" \"\n") != std::string::npos) {
      return key + "=\"" + EscapeText(value) + "\"";
    }
    return key + "=" + value;
  }

  static std::string EscapeText(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());
    for (char chr : str) {
      switch (chr) {
        case '"':
        case '\\':
          escaped += '\\';
          escaped += chr;
          break;
        case '\n':
          escaped += "\\n";
          break;
        case '\r':
          escaped += "\\r";
          break;
        case '\t':
          escaped += "\\t";
          break;
        default:
          escaped += chr;
      }
    }
    return escaped;
  }

  static std::string EscapeJSON(const std::string& str) {
    constexpr char kControlCharThreshold = 0x20;

    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped << R"(\")";
          break;
        case '\\':
          escaped << R"(\\)";
          break;
        case '\b':
          escaped << R"(\b)";
          break;
        case '\f':
          escaped << R"(\f)";
          break;
        case '\n':
          escaped << R"(\n)";
          break;
        case '\r':
          escaped << R"(\r)";
          break;
        case '\t':
          escaped << R"(\t)";
          break;
        default:
          if (chr >= 0 && chr < kControlCharThreshold) {
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr);
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }

  std::string event_;
  std::string message_;
  std::vector<LogField> fields_;
  static inline std::atomic<LogFormat> format_{LogFormat::JSON};
};

/**
 * @brief Host CPU detection finished
 */
inline void LogCpuDetection(const std::string& family, const std::string& level, const std::string& features,
                            bool forced) {
  StructuredLog()
      .Event("cpu_detection")
      .Field("family", family)
      .Field("level", level)
      .Field("features", features)
      .Field("forced", forced)
      .Info();
}

/**
 * @brief Feature probe failed; the family baseline is used instead
 */
inline void LogCpuDetectionFallback(const std::string& family, const std::string& baseline,
                                    const std::string& error_msg) {
  StructuredLog()
      .Event("cpu_detection_fallback")
      .Field("family", family)
      .Field("baseline", baseline)
      .Field("error", error_msg)
      .Warn();
}

inline void LogForceLevelIgnored(const std::string& requested, const std::string& reason) {
  StructuredLog().Event("force_level_ignored").Field("requested", requested).Field("reason", reason).Warn();
}

inline void LogVariantResolved(const std::string& function, const std::string& detected, const std::string& chosen,
                               const std::string& symbol) {
  StructuredLog()
      .Event("variant_resolved")
      .Field("function", function)
      .Field("detected", detected)
      .Field("chosen", chosen)
      .Field("symbol", symbol)
      .Debug();
}

inline void LogSymbolNotFound(const std::string& symbol, const std::string& detected) {
  StructuredLog().Event("symbol_not_found").Field("symbol", symbol).Field("detected", detected).Error();
}

/**
 * @brief Build architecture is not in the taxonomy
 */
inline void LogUnknownArchitecture(const std::string& fallback_family) {
  StructuredLog().Event("unknown_architecture").Field("fallback_family", fallback_family).Warn();
}

inline void LogConfigValidation(const std::string& path, bool valid, const std::string& detail) {
  StructuredLog log;
  log.Event("config_validation").Field("path", path).Field("valid", valid);
  if (!detail.empty()) {
    log.Field("detail", detail);
  }
  if (valid) {
    log.Info();
  } else {
    log.Error();
  }
}

}  // namespace mvdispatch::utils
