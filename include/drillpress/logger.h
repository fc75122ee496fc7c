/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of drillpress.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include <drillpress/source_location.h>

namespace drillpress {

class logger {
 public:
  enum level_type : unsigned {
    FATAL,
    ERROR,
    WARN,
    INFO,
    VERBOSE,
    DEBUG,
    TRACE
  };

  static char level_char(level_type level);

  virtual ~logger() = default;

  virtual void
  write(level_type level, std::string_view output, source_location loc) = 0;
  virtual level_type threshold() const = 0;

  std::string_view policy_name() const { return policy_name_; }

  static level_type parse_level(std::string_view level);
  static std::string_view level_name(level_type level);

  static std::string all_level_names();

 protected:
  template <class Policy>
  void set_policy() {
    policy_name_ = Policy::name();
  }

 private:
  std::string_view policy_name_;
};

std::ostream& operator<<(std::ostream& os, logger::level_type const& optval);
std::istream& operator>>(std::istream& is, logger::level_type& optval);

struct logger_options {
  logger::level_type threshold{logger::WARN};
  // defaults to on at VERBOSE and above
  std::optional<bool> with_context{};
};

/**
 * Writes timestamped entries to a stream. Multi-line messages are split,
 * continuation lines get a dotted timestamp. Thread-safe.
 */
class stream_logger : public logger {
 public:
  explicit stream_logger(std::ostream& os, logger_options const& options = {});

  void write(level_type level, std::string_view output,
             source_location loc) override;
  level_type threshold() const override { return threshold_; }

 private:
  std::ostream& os_;
  std::mutex mx_;
  level_type const threshold_;
  bool const with_context_;
};

class level_log_entry {
 public:
  level_log_entry(logger& lgr, logger::level_type level, source_location loc)
      : lgr_(lgr)
      , level_(level)
      , loc_(loc) {}

  level_log_entry(level_log_entry const&) = delete;

  ~level_log_entry() { lgr_.write(level_, oss_.str(), loc_); }

  template <typename T>
  level_log_entry& operator<<(T const& val) {
    oss_ << val;
    return *this;
  }

 private:
  logger& lgr_;
  std::ostringstream oss_;
  logger::level_type const level_;
  source_location const loc_;
};

// Appends wall clock and thread CPU time since construction, but only if
// something was written to the entry.
class cpu_timed_log_entry {
 public:
  cpu_timed_log_entry(logger& lgr, logger::level_type level,
                      source_location loc);
  cpu_timed_log_entry(cpu_timed_log_entry const&) = delete;
  ~cpu_timed_log_entry();

  template <typename T>
  cpu_timed_log_entry& operator<<(T const& val) {
    if (timer_) {
      oss_ << val;
    }
    return *this;
  }

 private:
  class timer;

  std::ostringstream oss_;
  std::unique_ptr<timer const> timer_;
};

class no_log_entry {
 public:
  no_log_entry(logger&, logger::level_type, source_location) {}

  template <typename T>
  no_log_entry& operator<<(T const&) {
    return *this;
  }
};

template <unsigned MinLogLevel>
class MinimumLogLevelPolicy {
 public:
  template <unsigned Level>
  using logger_type =
      std::conditional_t<Level <= MinLogLevel, level_log_entry, no_log_entry>;

  template <unsigned Level>
  using timed_logger_type = std::conditional_t<Level <= MinLogLevel,
                                               cpu_timed_log_entry, no_log_entry>;

  static constexpr bool is_enabled_for(logger::level_type level) {
    return level <= MinLogLevel;
  }
};

template <typename LogPolicy>
class log_proxy {
 public:
  log_proxy(logger& lgr)
      : lgr_(lgr)
      , threshold_(lgr.threshold()) {}

  static constexpr bool policy_is_enabled_for(logger::level_type level) {
    return LogPolicy::is_enabled_for(level);
  }

  bool logger_is_enabled_for(logger::level_type level) const {
    return level <= threshold_;
  }

  template <logger::level_type Level>
  auto entry(source_location loc) const {
    return typename LogPolicy::template logger_type<Level>(lgr_, Level, loc);
  }

  auto cpu_timed_debug(source_location loc) const {
    return typename LogPolicy::template timed_logger_type<logger::DEBUG>(
        lgr_, logger::DEBUG, loc);
  }

 private:
  logger& lgr_;
  logger::level_type const threshold_;
};

#define LOG_DETAIL_LEVEL(level)                                                \
  if constexpr (std::decay_t<decltype(log_)>::policy_is_enabled_for(           \
                    ::drillpress::logger::level))                              \
    if (log_.logger_is_enabled_for(::drillpress::logger::level))               \
  log_.template entry<::drillpress::logger::level>(                            \
      DRILLPRESS_CURRENT_SOURCE_LOCATION)

#define LOG_PROXY(policy, lgr) ::drillpress::log_proxy<policy> log_(lgr)
#define LOG_PROXY_DECL(policy) ::drillpress::log_proxy<policy> log_
#define LOG_PROXY_INIT(lgr) log_(lgr)
#define LOG_ERROR LOG_DETAIL_LEVEL(ERROR)
#define LOG_WARN LOG_DETAIL_LEVEL(WARN)
#define LOG_INFO LOG_DETAIL_LEVEL(INFO)
#define LOG_VERBOSE LOG_DETAIL_LEVEL(VERBOSE)
#define LOG_DEBUG LOG_DETAIL_LEVEL(DEBUG)
#define LOG_TRACE LOG_DETAIL_LEVEL(TRACE)
#define LOG_CPU_TIMED_DEBUG                                                    \
  log_.cpu_timed_debug(DRILLPRESS_CURRENT_SOURCE_LOCATION)

class prod_logger_policy : public MinimumLogLevelPolicy<logger::VERBOSE> {
 public:
  static std::string_view name() { return "prod"; }
};

class debug_logger_policy : public MinimumLogLevelPolicy<logger::TRACE> {
 public:
  static std::string_view name() { return "debug"; }
};

using logger_policies = std::tuple<debug_logger_policy, prod_logger_policy>;

namespace detail {

[[noreturn]] void unknown_logger_policy(std::string_view name);

template <class Base, template <class> class T, class... Policies,
          class... Args>
std::unique_ptr<Base>
make_for_policy(logger& lgr, std::type_identity<std::tuple<Policies...>>,
                Args&&... args) {
  std::unique_ptr<Base> obj;

  // at most one policy matches, so the arguments are forwarded only once
  static_cast<void>(
      ((lgr.policy_name() == Policies::name() &&
        (obj = std::make_unique<T<Policies>>(lgr, std::forward<Args>(args)...),
         true)) ||
       ...));

  if (!obj) {
    unknown_logger_policy(lgr.policy_name());
  }

  return obj;
}

} // namespace detail

// Creates T<Policy> for the policy the logger was configured with.
template <class Base, template <class> class T, class LoggerPolicyList,
          class... Args>
std::unique_ptr<Base> make_unique_logging_object(logger& lgr, Args&&... args) {
  return detail::make_for_policy<Base, T>(
      lgr, std::type_identity<LoggerPolicyList>{}, std::forward<Args>(args)...);
}

std::string get_current_time_string();

} // namespace drillpress
