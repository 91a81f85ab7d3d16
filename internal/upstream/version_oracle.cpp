#include "version_oracle.hpp"

#include <google/protobuf/util/json_util.h>

#include <cctype>

#include "git_refs.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace mirrorwatch::upstream {

namespace {

constexpr std::size_t kMinCommitChars = 7;

bool LooksLikeCommit(const std::string& commit) {
  if (commit.size() < kMinCommitChars) return false;
  for (char c : commit) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

} // namespace

// ------------------------------------------------------------------
// VersionHolder
// ------------------------------------------------------------------

VersionHolder::VersionHolder() : current_(std::make_shared<const UpstreamVersion>()) {
}

std::shared_ptr<const UpstreamVersion> VersionHolder::Get() const {
  return current_.load();
}

void VersionHolder::Set(UpstreamVersion version) {
  current_.store(std::make_shared<const UpstreamVersion>(std::move(version)));
}

// ------------------------------------------------------------------
// VersionOracle
// ------------------------------------------------------------------

VersionOracle::VersionOracle(mirrorwatch::runtime::config::UpstreamConfig config, std::shared_ptr<http::HttpClient> client,
                             std::shared_ptr<db::Repository> repository, std::chrono::milliseconds request_timeout)
    : config_(std::move(config)), client_(std::move(client)), repository_(std::move(repository)), request_timeout_(request_timeout) {
}

void VersionOracle::Restore() {
  auto tx     = repository_->Begin();
  auto stored = repository_->GetUpstreamVersion(*tx);
  tx->Commit();

  if (!stored || stored->branch != config_.branch()) {
    return;
  }

  holder_.Set({stored->commit, stored->branch, stored->refreshed_at_ms});
  MIRRORWATCH_LOG_INFO("restored upstream version", {observability::StringField("commit", stored->commit)});
}

RefreshOutcome VersionOracle::Refresh() {
  observability::SpanScope span("upstream.refresh");
  CycleEpoch();

  http::HttpRequest request;
  request.url     = InfoRefsUrl(config_.git_url());
  request.timeout = request_timeout_;

  auto outcome = http::Fetch(*client_, request);
  if (auto* error = std::get_if<http::FetchError>(&outcome)) {
    span.RecordError(error->message);
    MIRRORWATCH_LOG_WARN("upstream refresh failed, keeping previous version",
                         {observability::StringField("error", error->message), observability::StringField("url", request.url)});
    return *error;
  }

  const auto& response = std::get<http::HttpResponse>(outcome);
  auto        head     = FindBranchHead(response.body, config_.branch());
  if (!head) {
    http::FetchError error;
    error.category = v1::ERROR_CATEGORY_PARSE;
    error.message  = "branch " + config_.branch() + " not found in ref advertisement";
    span.RecordError(error.message);
    MIRRORWATCH_LOG_WARN("upstream refresh failed, keeping previous version", {observability::StringField("error", error.message)});
    return error;
  }

  UpstreamVersion version{*head, config_.branch(), util::ToUnixMillis(util::Now())};
  const auto      previous = holder_.Get();
  holder_.Set(version);
  span.SetAttribute("commit", version.commit);

  auto tx     = repository_->Begin();
  auto result = repository_->SaveUpstreamVersion(*tx, {version.commit, version.branch, version.refreshed_at_ms});
  if (result) {
    tx->Commit();
  } else {
    MIRRORWATCH_LOG_WARN("failed to persist upstream version", {observability::StringField("error", result.Describe())});
  }

  if (previous->commit != version.commit) {
    MIRRORWATCH_LOG_INFO("upstream version changed",
                         {observability::StringField("commit", version.commit), observability::StringField("branch", version.branch)});
  }
  return version;
}

void VersionOracle::CycleEpoch() {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  ++epoch_;
  for (auto it = cache_.begin(); it != cache_.end();) {
    if (epoch_ - it->second.epoch > 1) {
      it = cache_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t VersionOracle::CacheSize() const {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  return cache_.size();
}

CommitClassification VersionOracle::Classify(const std::string& commit) {
  return Classify(commit, *holder_.Get());
}

CommitClassification VersionOracle::Classify(const std::string& raw_commit, const UpstreamVersion& upstream) {
  const auto commit = util::ToLower(raw_commit);
  if (!upstream.Known() || !LooksLikeCommit(commit)) {
    return {};
  }

  const auto head = util::ToLower(upstream.commit);
  if (util::StartsWith(head, commit)) {
    return {v1::COMMIT_STATUS_CURRENT, true};
  }

  {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    // Answers are relative to the head they were computed against.
    if (cache_head_ != head) {
      cache_.clear();
      cache_head_ = head;
    }
    if (auto it = cache_.find(commit); it != cache_.end()) {
      it->second.epoch = epoch_;
      return {it->second.status, true};
    }
  }

  auto classification = Compare(commit, head);
  if (classification.resolved) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (cache_head_ == head) {
      cache_[commit] = {classification.status, epoch_};
    }
  }
  return classification;
}

CommitClassification VersionOracle::Compare(const std::string& commit, const std::string& head) {
  if (config_.compare_url().empty()) {
    return {};
  }

  http::HttpRequest request;
  request.url     = util::ReplaceAll(util::ReplaceAll(config_.compare_url(), "{base}", head), "{head}", commit);
  request.timeout = request_timeout_;
  request.headers.emplace_back("Accept", "application/vnd.github+json");

  auto result = client_->Get(request);
  if (!result.Ok()) {
    MIRRORWATCH_LOG_DEBUG("commit comparison failed", {observability::StringField("commit", commit), observability::StringField("error", result.error)});
    return {};
  }

  const auto& response = *result.response;
  // The upstream repository does not know the commit.
  if (response.status == 404 || response.status == 422) {
    return {v1::COMMIT_STATUS_UNKNOWN, true};
  }
  if (response.status < 200 || response.status >= 300) {
    MIRRORWATCH_LOG_DEBUG("commit comparison failed",
                          {observability::StringField("commit", commit), observability::IntField("status", response.status)});
    return {};
  }

  v1::CompareResult                        compared;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  if (!google::protobuf::util::JsonStringToMessage(response.body, &compared, options).ok()) {
    return {};
  }

  // base is the upstream head, so "behind" means the commit is an ancestor.
  const auto& status = compared.status();
  if (status == "identical") return {v1::COMMIT_STATUS_CURRENT, true};
  if (status == "behind") return {v1::COMMIT_STATUS_OUTDATED, true};
  if (status == "ahead" || status == "diverged") return {v1::COMMIT_STATUS_CUSTOM_BRANCH, true};
  return {};
}

bool VersionOracle::IsUpstreamUrl(const std::string& version_url) const {
  return !config_.web_url().empty() && util::IStartsWith(version_url, config_.web_url());
}

} // namespace mirrorwatch::upstream
