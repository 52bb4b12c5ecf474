#pragma once

#include <atomic>
#include <string>

namespace peatgrid {

    // Progress, messages and cancellation shared between a running algorithm and whoever started it.
    class Feedback {
      public:
        virtual ~Feedback() = default;

        virtual bool isCanceled() const = 0;
        virtual void setProgress(int percent) = 0;
        virtual void pushInfo(const std::string &message) = 0;
        virtual void reportError(const std::string &message) = 0;
    };

    // Forwards everything to the peatgrid logger. cancel() is safe to call from another thread or a
    // signal handler.
    class LoggingFeedback : public Feedback {
      public:
        bool isCanceled() const override { return canceled_.load(); }
        void cancel() { canceled_.store(true); }

        void setProgress(int percent) override;
        void pushInfo(const std::string &message) override;
        void reportError(const std::string &message) override;

        int progress() const { return progress_; }

      private:
        std::atomic<bool> canceled_{false};
        int progress_ = 0;
    };

} // namespace peatgrid
