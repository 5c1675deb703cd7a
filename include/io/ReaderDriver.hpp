#pragma once
/** @file  ReaderDriver.hpp
 *  @brief Abstract RFID reader: start / stop / isActive / resynchronize + tag callback.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <functional>
#include <mutex>

#include "protocols/TagReport.hpp"

namespace pantheon {
  namespace io {

    /**
 * @class ReaderDriver
 * @brief Base-class for reader adapters; emits decoded tag batches to one sink.
 *
 *  * The sink runs on the driver's own thread and must only hand off.
 *  * `resynchronize()` is a request, never a blocking exchange with the reader.
 */
    class ReaderDriver {
    public:
      using TagSink = std::function<void(protocols::TagSet)>;

      ReaderDriver() = default;
      virtual ~ReaderDriver() = default;

      /** @returns false if the reader cannot be opened. */
      virtual bool start() = 0;
      virtual void stop() = 0;
      virtual bool isActive() const = 0;

      /// Ask the reader to drop its session state and start reporting afresh.
      virtual void resynchronize() = 0;

      void setTagSink(TagSink sink) {
        std::lock_guard<std::mutex> lk(sinkMtx_);
        sink_ = std::move(sink);
      }

      ReaderDriver(const ReaderDriver&) = delete;
      ReaderDriver& operator=(const ReaderDriver&) = delete;

    protected:
      /** Derived classes call this for every non-empty decoded report. */
      void emit(protocols::TagSet tags) {
        TagSink sink;
        {
          std::lock_guard<std::mutex> lk(sinkMtx_);
          sink = sink_;
        }
        if (sink && !tags.empty())
          sink(std::move(tags));
      }

    private:
      std::mutex sinkMtx_;
      TagSink sink_{};
    };

  } // namespace io
} // namespace pantheon
