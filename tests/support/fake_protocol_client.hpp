#pragma once

#include "mx/archive/client.hpp"
#include "mx/core/cancellation.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mx::testing {

/**
 * @brief Scriptable ProtocolClient that records every call
 *
 * Failures are keyed by file name. Tracks how many calls run at once so
 * tests can check the worker bound. A watched token makes delayed calls
 * behave like the real client: they return Cancelled once it trips.
 */
class FakeProtocolClient : public archive::ProtocolClient {
public:
    struct Call {
        std::string phase;      ///< "initiate", "transfer", "finalize"
        std::string file_name;
        std::string session_id;
    };

    void fail_initiate(const std::string& file_name, archive::UploadError error) {
        std::lock_guard lock(mutex_);
        initiate_failures_[file_name] = std::move(error);
    }

    void fail_transfer(const std::string& file_name, archive::UploadError error) {
        std::lock_guard lock(mutex_);
        transfer_failures_[file_name] = std::move(error);
    }

    void fail_finalize(const std::string& file_name, archive::UploadError error) {
        std::lock_guard lock(mutex_);
        finalize_failures_[file_name] = std::move(error);
    }

    void reject_all_credentials() { reject_all_ = true; }

    void set_call_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    /// Overrides the call delay for every phase of one file
    void delay_file(const std::string& file_name, std::chrono::milliseconds delay) {
        std::lock_guard lock(mutex_);
        file_delays_[file_name] = delay;
    }

    void watch(const CancellationToken* token) { watched_ = token; }

    mx::Result<archive::UploadSession, archive::UploadError> initiate(const std::string& file_name,
                                                                      std::int64_t content_length) override {
        InFlight guard(*this);
        if (!wait_out_delay(file_name)) {
            return mx::Err(archive::UploadError::cancelled());
        }

        std::lock_guard lock(mutex_);
        initiate_lengths_[file_name] = content_length;
        if (reject_all_) {
            calls_.push_back({"initiate", file_name, ""});
            return mx::Err(archive::UploadError::auth());
        }
        auto failure = initiate_failures_.find(file_name);
        if (failure != initiate_failures_.end()) {
            calls_.push_back({"initiate", file_name, ""});
            return mx::Err(failure->second);
        }

        archive::UploadSession session;
        session.id = "sess-" + std::to_string(++next_session_);
        session.url = "https://storage.test/put/" + session.id;
        session_files_[session.id] = file_name;
        calls_.push_back({"initiate", file_name, session.id});
        return mx::Ok(session);
    }

    mx::Result<void, archive::UploadError> transfer(const std::filesystem::path& local_path,
                                                    std::uint64_t,
                                                    const std::string& destination_url) override {
        InFlight guard(*this);
        const auto file_name = local_path.filename().string();
        const auto session_id = destination_url.substr(destination_url.rfind('/') + 1);
        if (!wait_out_delay(file_name)) {
            return mx::Err(archive::UploadError::cancelled());
        }

        std::lock_guard lock(mutex_);
        calls_.push_back({"transfer", file_name, session_id});
        auto failure = transfer_failures_.find(file_name);
        if (failure != transfer_failures_.end()) {
            return mx::Err(failure->second);
        }
        return mx::Ok();
    }

    mx::Result<archive::FinalizedUpload, archive::UploadError> finalize(
        const archive::FinalizationRecord& record) override {
        InFlight guard(*this);
        if (!wait_out_delay(session_file(record.id))) {
            return mx::Err(archive::UploadError::cancelled());
        }

        std::lock_guard lock(mutex_);
        const auto file_name = session_files_[record.id];
        calls_.push_back({"finalize", file_name, record.id});
        last_tags_ = record.tags;
        auto failure = finalize_failures_.find(file_name);
        if (failure != finalize_failures_.end()) {
            return mx::Err(failure->second);
        }
        return mx::Ok(archive::FinalizedUpload{record.id, "https://archive.test/uploads/" + record.id});
    }

    std::vector<Call> calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

    std::size_t count(const std::string& phase) const {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(calls_.begin(), calls_.end(),
            [&](const Call& c) { return c.phase == phase; }));
    }

    std::vector<Call> calls_for(const std::string& file_name) const {
        std::lock_guard lock(mutex_);
        std::vector<Call> result;
        for (const auto& c : calls_) {
            if (c.file_name == file_name) {
                result.push_back(c);
            }
        }
        return result;
    }

    std::string session_file(const std::string& session_id) const {
        std::lock_guard lock(mutex_);
        auto it = session_files_.find(session_id);
        return it != session_files_.end() ? it->second : "";
    }

    std::int64_t initiate_length(const std::string& file_name) const {
        std::lock_guard lock(mutex_);
        auto it = initiate_lengths_.find(file_name);
        return it != initiate_lengths_.end() ? it->second : -1;
    }

    std::string last_tags() const {
        std::lock_guard lock(mutex_);
        return last_tags_;
    }

    int max_in_flight() const { return max_in_flight_.load(); }

private:
    /// Sleeps in short slices; false when the watched token trips meanwhile
    bool wait_out_delay(const std::string& file_name) {
        std::chrono::milliseconds remaining = delay_;
        {
            std::lock_guard lock(mutex_);
            auto it = file_delays_.find(file_name);
            if (it != file_delays_.end()) {
                remaining = it->second;
            }
        }

        constexpr std::chrono::milliseconds kSlice{5};
        while (true) {
            if (watched_ != nullptr && watched_->is_cancelled()) {
                return false;
            }
            if (remaining <= std::chrono::milliseconds::zero()) {
                return true;
            }
            const auto step = std::min(remaining, kSlice);
            std::this_thread::sleep_for(step);
            remaining -= step;
        }
    }

    class InFlight {
    public:
        explicit InFlight(FakeProtocolClient& owner) : owner_(owner) {
            int now = ++owner_.in_flight_;
            int prev = owner_.max_in_flight_.load();
            while (now > prev && !owner_.max_in_flight_.compare_exchange_weak(prev, now)) {
            }
        }
        ~InFlight() { --owner_.in_flight_; }

    private:
        FakeProtocolClient& owner_;
    };

    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::map<std::string, archive::UploadError> initiate_failures_;
    std::map<std::string, archive::UploadError> transfer_failures_;
    std::map<std::string, archive::UploadError> finalize_failures_;
    std::map<std::string, std::string> session_files_;
    std::map<std::string, std::int64_t> initiate_lengths_;
    std::map<std::string, std::chrono::milliseconds> file_delays_;
    std::string last_tags_;
    int next_session_ = 0;

    std::atomic<bool> reject_all_{false};
    std::chrono::milliseconds delay_{0};
    const CancellationToken* watched_ = nullptr;
    std::atomic<int> in_flight_{0};
    std::atomic<int> max_in_flight_{0};
};

} // namespace mx::testing
