/**
* @file observability.cpp
 * @brief JSON-line and silent implementations of Observer.
 */
#include "aqt/obs/observability.hpp"
#include <mutex>
#include <cstdio>

#include <nlohmann/json.hpp>

namespace aqt::obs {

    const char* to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::SimStarted:  return "sim_started";
            case EventKind::Injection:   return "injection";
            case EventKind::RoundDone:   return "round_done";
            case EventKind::SimFinished: return "sim_finished";
            case EventKind::Warning:     return "warning";
        }
        return "unknown";
    }

    class CountingObserver : public Observer {
    public:
        void record(const SimEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(e);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    protected:
        void count(const SimEvent& e) {
            switch (e.kind) {
                case EventKind::SimStarted:  ctr_.simulations++; break;
                case EventKind::Injection:   ctr_.injections++;  break;
                case EventKind::RoundDone:   ctr_.rounds++; ctr_.absorbed += e.absorbed; break;
                case EventKind::SimFinished: break;
                case EventKind::Warning:     ctr_.warnings++;    break;
            }
        }
        mutable std::mutex mu_;
        Counters ctr_;
    };

    class SimpleObserver final : public CountingObserver {
    public:
        void record(const SimEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(e);
            // One JSON object per line; warnings go to stderr
            const nlohmann::json line{
                {"sim", e.sim_id},
                {"event", to_string(e.kind)},
                {"rd", e.round},
                {"absorbed", e.absorbed},
                {"load", e.load},
                {"detail", e.detail},
            };
            std::FILE* out = (e.kind == EventKind::Warning) ? stderr : stdout;
            std::fprintf(out, "%s\n", line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).c_str());
            std::fflush(out);
        }
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

    Observer* make_null_observer() {
        static CountingObserver obs;
        return &obs;
    }

} // namespace aqt::obs
