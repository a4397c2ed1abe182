//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "upload/upload_engine.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

#include "scan/image_scanner.hpp"
#include "utils/clock/time_provider.hpp"

namespace galleryup {
namespace {
auto ElapsedSeconds(std::chrono::steady_clock::time_point since) -> double {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - since).count();
}

auto FolderName(const std::filesystem::path& folder) -> std::string {
  auto name = folder.filename();
  if (name.empty()) name = folder.parent_path().filename();
  return name.string();
}
}  // namespace

UploadEngine::UploadEngine(UploadConfig config, const TransferHandleFactory& factory)
    : config_(std::move(config)),
      api_(config_),
      slots_(config_.batch_size_, factory),
      workers_(config_.batch_size_) {}

UploadEngine::~UploadEngine() { workers_.Shutdown(); }

void UploadEngine::Publish(UploadEvent event) {
  if (!event_sink_) return;
  try {
    event_sink_(event);
  } catch (const std::exception& e) {
    std::cerr << "UploadEngine: event sink failed: " << e.what() << std::endl;
  }
}

void UploadEngine::Log(const gallery_path_t& path, std::string message) {
  Publish(EngineLog{path, std::move(message)});
}

auto UploadEngine::UploadOne(const std::filesystem::path& file, const remote_id_t& gallery_id,
                             const gallery_path_t&                 gallery_path,
                             std::chrono::steady_clock::time_point started) -> ImageOutcome {
  const file_name_t file_name = file.filename().string();
  try {
    auto    lease = slots_.Acquire();
    int64_t last  = 0;
    auto    on_progress = [&](int64_t sent, int64_t total) {
      if (sent > last) {
        gallery_bytes_sent_ += sent - last;
        last = sent;
      }
      const double elapsed = ElapsedSeconds(started);
      const double kibps =
          elapsed > 0.0 ? static_cast<double>(gallery_bytes_sent_.load()) / 1024.0 / elapsed : 0.0;
      Publish(ImageProgress{gallery_path, file_name, sent, total, kibps});
    };
    return api_.UploadImage(lease.Handle(), file, gallery_id, on_progress);
  } catch (const std::exception& e) {
    return UploadFailure{file_name, UploadErrorCode::NETWORK_ERROR,
                         std::string("Network error: ") + e.what()};
  }
}

auto UploadEngine::BackoffFor(const std::vector<UploadFailure>& failures) const
    -> std::chrono::milliseconds {
  uint32_t factor = 1;
  for (const auto& failure : failures) {
    if (failure.code_ == UploadErrorCode::CONNECT_FAILED) {
      factor = 4;
      break;
    }
    if (failure.code_ == UploadErrorCode::TIMEOUT) factor = 2;
  }
  return std::chrono::milliseconds(static_cast<int64_t>(config_.retry_backoff_ms_) * factor);
}

void UploadEngine::WaitBackoff(std::chrono::milliseconds delay, const UploadJob& job) const {
  constexpr auto slice    = std::chrono::milliseconds(50);
  const auto     deadline = std::chrono::steady_clock::now() + delay;
  while (!job.StopRequested()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return;
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
  }
}

auto UploadEngine::AcquireGallery(std::vector<file_name_t>& pending, PassContext& ctx)
    -> remote_id_t {
  const auto& path = ctx.request_.path_;
  if (config_.named_gallery_creation_ && api_.HasWebSession()) {
    std::optional<remote_id_t> named;
    {
      auto lease = slots_.Acquire();
      named      = api_.CreateNamedGallery(lease.Handle(), ctx.gallery_name_);
    }
    if (named.has_value()) {
      Log(path, "Created gallery '" + ctx.gallery_name_ + "' (" + *named + ")");
      return *named;
    }
    Log(path, "Named gallery creation failed, creating it with the first image instead");
  }

  const file_name_t first = pending.front();
  std::string       last_reason;
  for (uint32_t attempt = 0; attempt <= config_.max_retries_; ++attempt) {
    if (ctx.job_.StopRequested()) return {};
    ImageOutcome outcome =
        UploadOne(std::filesystem::path(path) / first, remote_id_t{}, path, ctx.started_);
    if (auto* success = std::get_if<UploadSuccess>(&outcome)) {
      if (success->gallery_id_.empty()) {
        throw UploadError("Failed to create gallery: host reply carried no gallery id");
      }
      remote_id_t id = success->gallery_id_;
      ctx.successes_.push_back(*success);
      ++ctx.completed_;
      Publish(ImageCompleted{path, outcome, ctx.completed_, ctx.total_images_});
      pending.erase(pending.begin());
      if (rename_sink_) {
        rename_sink_(PendingRename{id, ctx.gallery_name_, TimeProvider::EpochSeconds()});
      }
      Log(path, "Created gallery " + id + " with " + first);
      return id;
    }
    const auto& failure = std::get<UploadFailure>(outcome);
    last_reason         = failure.reason_;
    Log(path, "Gallery creation with " + first + " failed: " + last_reason);
    if (attempt < config_.max_retries_) WaitBackoff(BackoffFor({failure}), ctx.job_);
  }
  throw UploadError("Failed to create gallery: " + last_reason);
}

auto UploadEngine::RunPass(const std::vector<file_name_t>& files, PassContext& ctx)
    -> std::vector<UploadFailure> {
  std::vector<UploadFailure> failures;
  const std::filesystem::path folder(ctx.request_.path_);
  size_t                      next      = 0;
  size_t                      in_flight = 0;

  auto submit = [&](const file_name_t& name) {
    ++in_flight;
    workers_.Submit([this, file = folder / name, gallery_id = ctx.gallery_id_,
                     path = ctx.request_.path_, started = ctx.started_]() {
      completions_.push(UploadOne(file, gallery_id, path, started));
    });
  };

  while (next < files.size() && in_flight < config_.batch_size_ && !ctx.job_.StopRequested()) {
    submit(files[next++]);
  }
  while (in_flight > 0) {
    ImageOutcome outcome = completions_.pop();
    --in_flight;
    if (auto* success = std::get_if<UploadSuccess>(&outcome)) {
      ctx.successes_.push_back(*success);
      ++ctx.completed_;
      Log(ctx.request_.path_, "[" + ctx.gallery_id_ + "] " + success->file_name_ +
                                  " uploaded (" + success->record_.url_ + ")");
    } else {
      failures.push_back(std::get<UploadFailure>(outcome));
    }
    Publish(ImageCompleted{ctx.request_.path_, outcome, ctx.completed_, ctx.total_images_});

    // Soft stop: in-flight uploads finish, nothing new is submitted
    if (next < files.size() && !ctx.job_.StopRequested()) submit(files[next++]);
  }
  return failures;
}

auto UploadEngine::DominantExtension(const std::vector<ImageRecord>& images) -> std::string {
  std::map<std::string, size_t> counts;
  std::vector<std::string>      first_seen;
  for (const auto& image : images) {
    std::string ext = std::filesystem::path(image.file_name_).extension().string();
    if (ext.empty()) continue;
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (counts[ext]++ == 0) first_seen.push_back(ext);
  }
  std::string best = "JPG";
  size_t      best_count = 0;
  for (const auto& ext : first_seen) {
    if (counts[ext] > best_count) {
      best       = ext;
      best_count = counts[ext];
    }
  }
  return best;
}

auto UploadEngine::Run(const UploadRequest& request, UploadJob& job) -> UploadResult {
  const auto                  started = std::chrono::steady_clock::now();
  const std::filesystem::path folder(request.path_);

  UploadResult result;
  result.path_             = request.path_;
  result.template_name_    = request.template_name_;
  result.started_at_       = TimeProvider::EpochSeconds();
  result.thumbnail_size_   = config_.thumbnail_size_;
  result.thumbnail_format_ = config_.thumbnail_format_;
  result.public_gallery_   = config_.public_gallery_;
  result.batch_size_       = config_.batch_size_;
  result.gallery_name_ =
      SanitizeGalleryName(request.name_.empty() ? FolderName(folder) : request.name_);

  const auto files = ImageScanner::EnumerateImages(folder);
  if (files.empty()) {
    throw UploadError("No images found in " + request.path_);
  }
  result.total_images_ = static_cast<uint32_t>(files.size());
  for (const auto& name : files) {
    std::error_code ec;
    auto            size = std::filesystem::file_size(folder / name, ec);
    if (!ec) result.total_size_ += static_cast<int64_t>(size);
  }

  std::vector<file_name_t> pending;
  for (const auto& name : files) {
    if (request.uploaded_files_.count(name) == 0) pending.push_back(name);
  }

  gallery_bytes_sent_ = 0;
  slots_.BeginGallery();

  remote_id_t                gallery_id = request.gallery_id_;
  std::vector<UploadSuccess> successes;
  uint32_t                   completed = static_cast<uint32_t>(files.size() - pending.size());
  PassContext ctx{request,   job,       result.gallery_name_, gallery_id, successes,
                  result.total_images_, completed,            started};

  if (!pending.empty() && !job.StopRequested()) {
    if (gallery_id.empty()) {
      gallery_id = AcquireGallery(pending, ctx);
    } else {
      Log(request.path_, "Resuming gallery " + gallery_id + ", " +
                             std::to_string(pending.size()) + " file(s) left");
    }
  }
  Publish(GalleryStarted{request.path_, gallery_id, result.total_images_,
                         static_cast<uint32_t>(pending.size())});

  std::vector<UploadFailure> failures;
  if (!gallery_id.empty()) {
    failures      = RunPass(pending, ctx);
    uint32_t pass = 0;
    while (!failures.empty() && pass < config_.max_retries_ && !job.StopRequested()) {
      ++pass;
      Log(request.path_, "Retrying " + std::to_string(failures.size()) +
                             " failed upload(s) (attempt " + std::to_string(pass) + "/" +
                             std::to_string(config_.max_retries_) + ")");
      WaitBackoff(BackoffFor(failures), job);
      if (job.StopRequested()) break;
      std::vector<file_name_t> retry;
      for (const auto& failure : failures) retry.push_back(failure.file_name_);
      failures = RunPass(retry, ctx);
    }
  }

  // Resumed records first, then this run's results replace them by name
  std::unordered_map<file_name_t, ImageRecord> by_name;
  for (const auto& record : request.uploaded_images_data_) by_name[record.file_name_] = record;
  for (const auto& success : successes) {
    by_name[success.file_name_] = success.record_;
    result.sent_bytes_ += success.record_.size_bytes_;
  }
  for (const auto& name : files) {
    auto it = by_name.find(name);
    if (it == by_name.end()) continue;
    result.images_.push_back(std::move(it->second));
    by_name.erase(it);
  }
  // Resumed files that are no longer on disk do not count towards this gallery
  if (!by_name.empty()) {
    Log(request.path_, std::to_string(by_name.size()) +
                           " previously uploaded file(s) no longer on disk, dropped from the result");
  }

  std::vector<PixelSize> sampled;
  for (auto& image : result.images_) {
    if (sampled.size() >= config_.dimension_samples_) break;
    auto dims = ImageScanner::ReadDimensions(folder / image.file_name_);
    if (!dims) continue;
    image.width_  = dims->width_;
    image.height_ = dims->height_;
    sampled.push_back(*dims);
  }
  result.dimensions_ = ImageScanner::ComputeStats(sampled, false, false);

  for (const auto& failure : failures) {
    result.failures_.push_back({failure.file_name_, failure.reason_});
  }
  for (const auto& image : result.images_) result.uploaded_size_ += image.size_bytes_;

  result.successful_count_   = static_cast<uint32_t>(result.images_.size());
  result.failed_count_       = static_cast<uint32_t>(result.failures_.size());
  result.dominant_extension_ = DominantExtension(result.images_);
  result.gallery_id_         = gallery_id;
  if (!gallery_id.empty()) result.gallery_url_ = api_.GalleryUrl(gallery_id);
  result.soft_stopped_  = job.StopRequested();
  result.upload_time_s_ = ElapsedSeconds(started);
  result.kibps_         = result.upload_time_s_ > 0.0
                              ? static_cast<double>(result.sent_bytes_) / 1024.0 / result.upload_time_s_
                              : 0.0;
  result.finished_at_   = TimeProvider::EpochSeconds();

  std::ostringstream summary;
  if (result.failures_.empty()) {
    summary << "Uploaded " << result.successful_count_ << " image(s) in " << result.upload_time_s_
            << "s: " << result.gallery_name_ << " -> " << result.gallery_url_;
  } else {
    summary << "Gallery '" << gallery_id << "' finished with failures ("
            << result.successful_count_ << "/" << result.total_images_ << " images)";
  }
  Log(request.path_, summary.str());
  for (const auto& failure : result.failures_) {
    Log(request.path_, failure.file_name_ + ": " + failure.reason_);
  }
  Publish(GalleryFinished{request.path_, result.successful_count_, result.failed_count_,
                          result.soft_stopped_});
  return result;
}
};  // namespace galleryup
