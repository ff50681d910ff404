#include "a3c/Checkpointer.hpp"

#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <utility>

namespace a3c {

namespace fs = boost::filesystem;

FileCheckpointer::FileCheckpointer(const fs::path& model_dir, int max_snapshots_kept)
    : model_dir_(model_dir), max_snapshots_kept_(max_snapshots_kept) {}

void FileCheckpointer::save_snapshot(const ParameterVector& parameters, int64_t episode) {
  fs::create_directories(model_dir_);

  fs::path path = model_dir_ / ("model-" + std::to_string(episode) + ".bin");
  fs::path tmp_path = path;
  tmp_path += ".tmp";
  write(tmp_path, parameters, episode);
  fs::rename(tmp_path, path);
  LOG_INFO("Saved model snapshot {}", path.string());

  std::vector<fs::path> snapshots = list_snapshots();
  int excess = (int)snapshots.size() - max_snapshots_kept_;
  for (int i = 0; i < excess; ++i) {
    fs::remove(snapshots[i]);
  }
}

std::optional<FileCheckpointer::Snapshot> FileCheckpointer::load_latest() const {
  std::vector<fs::path> snapshots = list_snapshots();
  if (snapshots.empty()) return std::nullopt;
  return read(snapshots.back());
}

std::vector<fs::path> FileCheckpointer::list_snapshots() const {
  std::vector<std::pair<int64_t, fs::path>> found;
  if (fs::is_directory(model_dir_)) {
    for (const auto& entry : fs::directory_iterator(model_dir_)) {
      auto episode = parse_episode(entry.path());
      if (episode) found.emplace_back(*episode, entry.path());
    }
  }
  std::sort(found.begin(), found.end());

  std::vector<fs::path> out;
  for (auto& [episode, path] : found) out.push_back(path);
  return out;
}

FileCheckpointer::Snapshot FileCheckpointer::read(const fs::path& path) {
  std::ifstream file(path.string(), std::ios::binary);
  if (!file.is_open()) {
    throw util::Exception("Unable to open snapshot {}", path.string());
  }

  uint32_t magic = 0;
  int64_t count = 0;
  Snapshot snapshot;
  file.read(reinterpret_cast<char*>(&magic), sizeof(magic));
  file.read(reinterpret_cast<char*>(&count), sizeof(count));
  file.read(reinterpret_cast<char*>(&snapshot.episode), sizeof(snapshot.episode));
  if (!file || magic != kMagic || count < 0) {
    throw util::Exception("Corrupt snapshot header in {}", path.string());
  }

  snapshot.values.resize(count);
  file.read(reinterpret_cast<char*>(snapshot.values.data()), count * sizeof(float));
  if (!file) {
    throw util::Exception("Truncated snapshot {} (expected {} parameters)", path.string(), count);
  }
  return snapshot;
}

void FileCheckpointer::write(const fs::path& path, const ParameterVector& parameters,
                             int64_t episode) {
  std::ofstream file(path.string(), std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    throw util::Exception("Unable to open file: {}", path.string());
  }

  uint32_t magic = kMagic;
  int64_t count = parameters.size();
  file.write(reinterpret_cast<const char*>(&magic), sizeof(magic));
  file.write(reinterpret_cast<const char*>(&count), sizeof(count));
  file.write(reinterpret_cast<const char*>(&episode), sizeof(episode));
  file.write(reinterpret_cast<const char*>(parameters.data()), count * sizeof(float));
  if (!file) {
    throw util::Exception("Failed writing snapshot {}", path.string());
  }
}

std::optional<int64_t> FileCheckpointer::parse_episode(const fs::path& path) {
  std::string stem = path.stem().string();
  if (path.extension() != ".bin" || stem.rfind("model-", 0) != 0) return std::nullopt;

  std::string digits = stem.substr(6);
  auto is_digit = [](unsigned char c) { return std::isdigit(c) != 0; };
  if (digits.empty() || !std::all_of(digits.begin(), digits.end(), is_digit)) {
    return std::nullopt;
  }
  return std::stoll(digits);
}

JsonTelemetryWriter::JsonTelemetryWriter(const fs::path& summary_dir) : summary_dir_(summary_dir) {}

void JsonTelemetryWriter::record_summary(int worker_index, const Metrics& metrics,
                                         int64_t episode) {
  boost::json::object obj;
  obj["episode"] = episode;
  obj["worker"] = worker_index;
  for (const auto& [tag, value] : metrics) {
    obj[tag] = value;
  }

  fs::path path = summary_path(worker_index);

  std::unique_lock lock(mutex_);
  fs::create_directories(path.parent_path());
  std::ofstream file(path.string(), std::ios::app);
  if (!file.is_open()) {
    throw util::Exception("Unable to open file: {}", path.string());
  }
  file << boost::json::serialize(obj) << '\n';
}

fs::path JsonTelemetryWriter::summary_path(int worker_index) const {
  return summary_dir_ / ("train_" + std::to_string(worker_index)) / "summary.jsonl";
}

}  // namespace a3c
