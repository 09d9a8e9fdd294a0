#include "core/transfer_config.h"

// Runtime knobs shared by every pipeline run. They start at their defaults
// and are changed through the validated setters, usually by EngineConfig
// while loading config.json or the environment.
std::atomic<size_t> TransferConfig::BATCH_SIZE =
    TransferConfig::DEFAULT_BATCH_SIZE;
std::atomic<size_t> TransferConfig::MAX_RECORDED_ERRORS =
    TransferConfig::DEFAULT_MAX_RECORDED_ERRORS;
std::atomic<size_t> TransferConfig::CSV_SAMPLE_SIZE =
    TransferConfig::DEFAULT_CSV_SAMPLE_SIZE;
std::atomic<size_t> TransferConfig::PROGRESS_CAPACITY =
    TransferConfig::DEFAULT_PROGRESS_CAPACITY;
std::atomic<size_t> TransferConfig::MAX_WORKERS =
    TransferConfig::DEFAULT_MAX_WORKERS;
std::atomic<size_t> TransferConfig::FLATTEN_MAX_DEPTH =
    TransferConfig::DEFAULT_FLATTEN_MAX_DEPTH;
std::atomic<size_t> TransferConfig::FLATTEN_MAX_ARRAY_WIDTH =
    TransferConfig::DEFAULT_FLATTEN_MAX_ARRAY_WIDTH;

void TransferConfig::resetDefaults() {
  BATCH_SIZE = DEFAULT_BATCH_SIZE;
  MAX_RECORDED_ERRORS = DEFAULT_MAX_RECORDED_ERRORS;
  CSV_SAMPLE_SIZE = DEFAULT_CSV_SAMPLE_SIZE;
  PROGRESS_CAPACITY = DEFAULT_PROGRESS_CAPACITY;
  MAX_WORKERS = DEFAULT_MAX_WORKERS;
  FLATTEN_MAX_DEPTH = DEFAULT_FLATTEN_MAX_DEPTH;
  FLATTEN_MAX_ARRAY_WIDTH = DEFAULT_FLATTEN_MAX_ARRAY_WIDTH;
}
