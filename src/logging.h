/**
 * @file src/logging.h
 * @brief Declarations for logging related functions.
 */
#pragma once

// standard includes
#include <memory>
#include <string>

// lib includes
#include <boost/log/common.hpp>
#include <boost/log/sinks.hpp>

using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

extern boost::log::sources::severity_logger<int> verbose;
extern boost::log::sources::severity_logger<int> debug;
extern boost::log::sources::severity_logger<int> info;
extern boost::log::sources::severity_logger<int> warning;
extern boost::log::sources::severity_logger<int> error;
extern boost::log::sources::severity_logger<int> fatal;
#ifdef VAVK_TESTS
extern boost::log::sources::severity_logger<int> tests;
#endif

/**
 * @brief Handles the initialization and deinitialization of the logging system.
 */
namespace logging {
  class deinit_t {
  public:
    explicit deinit_t(boost::shared_ptr<text_sink> sink);

    /**
     * @brief Flush and detach the sink this guard was created for.
     *
     * Only the guard's own reference is used, so a guard with static storage
     * may be destroyed after the logging globals.
     */
    ~deinit_t();

  private:
    boost::shared_ptr<text_sink> sink;
  };

  /**
   * @brief Deinitialize the logging system.
   * @examples
   * deinit();
   * @examples_end
   */
  void deinit();

  void formatter(const boost::log::record_view &view, boost::log::formatting_ostream &os);

  /**
   * @brief Initialize the logging system.
   * @param min_log_level The minimum log level to output.
   * @param log_file The log file to write to, may be empty to log to stderr only.
   * @return An object that will deinitialize the logging system when it goes out of scope.
   * @examples
   * log_init(2, "vavk.log");
   * @examples_end
   */
  [[nodiscard]] std::unique_ptr<deinit_t> init(int min_log_level, const std::string &log_file);

  /**
   * @brief Flush the log.
   * @examples
   * log_flush();
   * @examples_end
   */
  void log_flush();
}  // namespace logging
