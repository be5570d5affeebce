#ifndef HVDRIVER_HELPERS_LOG_HPP
#define HVDRIVER_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Thin logging front-end over Boost.Log's trivial logger.
 *
 * Messages are formatted with fmt before they reach Boost.Log, so call sites
 * read like the rest of the code base:
 *
 *   log::debug("restored state for pod {}", podId);
 *
 * @note NOT RT-SAFE: Formats into std::string and goes through Boost.Log sinks.
 */

#include <string_view>
#include <utility>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include <fmt/core.h>

namespace hvdriver {
namespace helpers {
namespace log {

/* ----------------------------- Level ----------------------------- */

/// Severity threshold, mirrors boost::log::trivial::severity_level.
enum class Level : unsigned char {
  TRACE = 0,
  DEBUG,
  INFO,
  WARNING,
  ERROR,
};

namespace detail {

inline boost::log::trivial::severity_level toBoost(Level level) noexcept {
  switch (level) {
  case Level::TRACE:
    return boost::log::trivial::trace;
  case Level::DEBUG:
    return boost::log::trivial::debug;
  case Level::INFO:
    return boost::log::trivial::info;
  case Level::WARNING:
    return boost::log::trivial::warning;
  case Level::ERROR:
    return boost::log::trivial::error;
  }
  return boost::log::trivial::info;
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Set the minimum severity that reaches the default console sink.
 * @param level Records below this level are dropped.
 */
inline void init(Level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= detail::toBoost(level));
}

template <typename... Args> void trace(fmt::format_string<Args...> fmtStr, Args&&... args) {
  BOOST_LOG_TRIVIAL(trace) << fmt::format(fmtStr, std::forward<Args>(args)...);
}

template <typename... Args> void debug(fmt::format_string<Args...> fmtStr, Args&&... args) {
  BOOST_LOG_TRIVIAL(debug) << fmt::format(fmtStr, std::forward<Args>(args)...);
}

template <typename... Args> void info(fmt::format_string<Args...> fmtStr, Args&&... args) {
  BOOST_LOG_TRIVIAL(info) << fmt::format(fmtStr, std::forward<Args>(args)...);
}

template <typename... Args> void warn(fmt::format_string<Args...> fmtStr, Args&&... args) {
  BOOST_LOG_TRIVIAL(warning) << fmt::format(fmtStr, std::forward<Args>(args)...);
}

template <typename... Args> void error(fmt::format_string<Args...> fmtStr, Args&&... args) {
  BOOST_LOG_TRIVIAL(error) << fmt::format(fmtStr, std::forward<Args>(args)...);
}

} // namespace log
} // namespace helpers
} // namespace hvdriver

#endif // HVDRIVER_HELPERS_LOG_HPP
