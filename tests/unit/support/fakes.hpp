#pragma once

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fetchgate/v1/tunnel.pb.h"
#include "internal/storage/artifact_store.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/tunnel/agent_connection.hpp"
#include "internal/util/errors.hpp"

namespace fetchgate::testing {

// Records everything the server sends down a tunnel.
class FakeAgentConnection final : public tunnel::AgentConnection {
 public:
  FakeAgentConnection(std::string agent_id, std::string session_id) : agent_id_(std::move(agent_id)), session_id_(std::move(session_id)) {
  }

  const std::string& AgentId() const override {
    return agent_id_;
  }
  const std::string& SessionId() const override {
    return session_id_;
  }

  bool Send(const fetchgate::v1::ServerMessage& message) override {
    std::function<void(const fetchgate::v1::ServerMessage&)> hook;
    {
      std::lock_guard lock(mutex_);
      if (closed_ || fail_sends_) return false;
      sent_.push_back(message);
      hook = on_send_;
    }
    if (hook) hook(message);
    return true;
  }

  // Runs after each successful Send, on the sending thread.
  void OnSend(std::function<void(const fetchgate::v1::ServerMessage&)> hook) {
    std::lock_guard lock(mutex_);
    on_send_ = std::move(hook);
  }

  void Close(std::string_view reason) override {
    std::lock_guard lock(mutex_);
    closed_       = true;
    close_reason_ = std::string(reason);
  }

  bool IsClosed() const override {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  void FailSends() {
    std::lock_guard lock(mutex_);
    fail_sends_ = true;
  }

  std::vector<fetchgate::v1::ServerMessage> Sent() const {
    std::lock_guard lock(mutex_);
    return sent_;
  }

  std::string CloseReason() const {
    std::lock_guard lock(mutex_);
    return close_reason_;
  }

 private:
  std::string agent_id_;
  std::string session_id_;

  mutable std::mutex                        mutex_;
  std::vector<fetchgate::v1::ServerMessage> sent_;
  bool                                      closed_     = false;
  bool                                      fail_sends_ = false;
  std::string                               close_reason_;
  std::function<void(const fetchgate::v1::ServerMessage&)> on_send_;
};

// A tunnel whose peer stopped reading: Send blocks until Release() or Close().
class StalledAgentConnection final : public tunnel::AgentConnection {
 public:
  StalledAgentConnection(std::string agent_id, std::string session_id) : agent_id_(std::move(agent_id)), session_id_(std::move(session_id)) {
  }

  const std::string& AgentId() const override {
    return agent_id_;
  }
  const std::string& SessionId() const override {
    return session_id_;
  }

  bool Send(const fetchgate::v1::ServerMessage&) override {
    std::unique_lock lock(mutex_);
    ++blocked_;
    cv_.notify_all();
    cv_.wait(lock, [this] { return closed_ || released_; });
    --blocked_;
    return !closed_;
  }

  void Close(std::string_view) override {
    std::lock_guard lock(mutex_);
    closed_ = true;
    cv_.notify_all();
  }

  bool IsClosed() const override {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  void Release() {
    std::lock_guard lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

  void WaitUntilBlocked() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return blocked_ > 0; });
  }

 private:
  std::string agent_id_;
  std::string session_id_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  int                     blocked_  = 0;
  bool                    closed_   = false;
  bool                    released_ = false;
};

/*
  Artifact store kept in memory.
  Finished artifacts land in Published(), abandoned ones in Abandoned().
  FailAppendsAfter(n) makes every append past n total bytes throw.
*/
class MemoryArtifactStore final : public storage::ArtifactStore {
 public:
  std::filesystem::path Resolve(const std::string& agent_id, const std::string& transfer_id, const std::string& source_path) const override {
    return storage::common::ArtifactPath("/memory", agent_id, transfer_id, source_path);
  }

  std::unique_ptr<storage::ArtifactWriter> Open(const std::filesystem::path& artifact_path) override {
    {
      std::lock_guard lock(mutex_);
      ++opened_;
    }
    return std::make_unique<Writer>(this, artifact_path.string());
  }

  void FailAppendsAfter(std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    fail_after_ = bytes;
    fail_armed_ = true;
  }

  std::map<std::string, std::string> Published() const {
    std::lock_guard lock(mutex_);
    return published_;
  }

  std::map<std::string, std::string> Abandoned() const {
    std::lock_guard lock(mutex_);
    return abandoned_;
  }

  int Opened() const {
    std::lock_guard lock(mutex_);
    return opened_;
  }

 private:
  class Writer final : public storage::ArtifactWriter {
   public:
    Writer(MemoryArtifactStore* store, std::string path) : store_(store), path_(std::move(path)) {
    }

    void Append(std::string_view bytes) override {
      {
        std::lock_guard lock(store_->mutex_);
        if (store_->fail_armed_ && data_.size() + bytes.size() > store_->fail_after_) {
          throw util::ArtifactWriteFailure("no space left on device");
        }
      }
      data_.append(bytes.data(), bytes.size());
    }

    void Finish(bool) override {
      std::lock_guard lock(store_->mutex_);
      store_->published_[path_] = data_;
    }

    void Abandon() noexcept override {
      std::lock_guard lock(store_->mutex_);
      store_->abandoned_[path_] = data_;
    }

    std::uint64_t BytesWritten() const override {
      return data_.size();
    }

   private:
    MemoryArtifactStore* store_;
    std::string          path_;
    std::string          data_;
  };

  mutable std::mutex                 mutex_;
  std::map<std::string, std::string> published_;
  std::map<std::string, std::string> abandoned_;
  std::uint64_t                      fail_after_ = 0;
  bool                               fail_armed_ = false;
  int                                opened_     = 0;
};

} // namespace fetchgate::testing
