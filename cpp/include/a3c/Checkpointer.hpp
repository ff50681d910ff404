#pragma once

#include "a3c/Types.hpp"

#include <boost/filesystem.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace a3c {

struct PersistenceParams {
  auto make_options_description();

  std::string model_dir = "models";
  std::string summary_dir = "summaries";
  int max_snapshots_kept = 50;
};

class Checkpointer {
 public:
  virtual ~Checkpointer() = default;
  virtual void save_snapshot(const ParameterVector& parameters, int64_t episode) = 0;
};

class TelemetrySink {
 public:
  using Metrics = std::map<std::string, float>;

  virtual ~TelemetrySink() = default;
  virtual void record_summary(int worker_index, const Metrics& metrics, int64_t episode) = 0;
};

/*
 * Writes parameter snapshots to <model_dir>/model-<episode>.bin and prunes all but the most
 * recent max_snapshots_kept of them.
 *
 * File layout (native endianness):
 *
 * uint32 magic | int64 parameter count | int64 episode | float[count] parameters
 */
class FileCheckpointer : public Checkpointer {
 public:
  struct Snapshot {
    ParameterVector values;
    int64_t episode;
  };

  static constexpr uint32_t kMagic = 0x50433341;  // "A3CP"

  FileCheckpointer(const boost::filesystem::path& model_dir, int max_snapshots_kept);

  void save_snapshot(const ParameterVector& parameters, int64_t episode) override;

  // The snapshot with the highest episode count, if any.
  std::optional<Snapshot> load_latest() const;

  // Existing snapshot files, oldest first.
  std::vector<boost::filesystem::path> list_snapshots() const;

  static Snapshot read(const boost::filesystem::path& path);
  static void write(const boost::filesystem::path& path, const ParameterVector& parameters,
                    int64_t episode);

 private:
  static std::optional<int64_t> parse_episode(const boost::filesystem::path& path);

  const boost::filesystem::path model_dir_;
  const int max_snapshots_kept_;
};

/*
 * Appends one JSON object per summary to <summary_dir>/train_<worker>/summary.jsonl:
 *
 * {"episode": 25, "worker": 0, "Perf/Reward": 3.2, ...}
 */
class JsonTelemetryWriter : public TelemetrySink {
 public:
  explicit JsonTelemetryWriter(const boost::filesystem::path& summary_dir);

  void record_summary(int worker_index, const Metrics& metrics, int64_t episode) override;

  boost::filesystem::path summary_path(int worker_index) const;

 private:
  const boost::filesystem::path summary_dir_;
  std::mutex mutex_;
};

}  // namespace a3c

#include "inline/a3c/Checkpointer.inl"
