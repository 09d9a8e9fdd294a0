#ifndef TRANSFER_CONFIG_H
#define TRANSFER_CONFIG_H

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <string>

struct TransferConfig {
  static std::atomic<size_t> BATCH_SIZE;
  static std::atomic<size_t> MAX_RECORDED_ERRORS;
  static std::atomic<size_t> CSV_SAMPLE_SIZE;
  static std::atomic<size_t> PROGRESS_CAPACITY;
  static std::atomic<size_t> MAX_WORKERS;
  static std::atomic<size_t> FLATTEN_MAX_DEPTH;
  static std::atomic<size_t> FLATTEN_MAX_ARRAY_WIDTH;

  static constexpr size_t DEFAULT_BATCH_SIZE = 1000;
  static constexpr size_t DEFAULT_MAX_RECORDED_ERRORS = 100;
  static constexpr size_t DEFAULT_CSV_SAMPLE_SIZE = 1000;
  static constexpr size_t DEFAULT_PROGRESS_CAPACITY = 64;
  static constexpr size_t DEFAULT_MAX_WORKERS = 2;
  static constexpr size_t DEFAULT_FLATTEN_MAX_DEPTH = 16;
  static constexpr size_t DEFAULT_FLATTEN_MAX_ARRAY_WIDTH = 64;

  static constexpr size_t MIN_BATCH_SIZE = 1;
  static constexpr size_t MAX_BATCH_SIZE = 100000;
  static constexpr size_t MIN_RECORDED_ERRORS = 1;
  static constexpr size_t MAX_RECORDED_ERRORS_LIMIT = 100000;
  static constexpr size_t MIN_CSV_SAMPLE_SIZE = 1;
  static constexpr size_t MAX_CSV_SAMPLE_SIZE = 1000000;
  static constexpr size_t MIN_PROGRESS_CAPACITY = 1;
  static constexpr size_t MAX_PROGRESS_CAPACITY = 4096;
  static constexpr size_t MIN_MAX_WORKERS = 1;
  static constexpr size_t MAX_MAX_WORKERS = 32;
  static constexpr size_t MIN_FLATTEN_MAX_DEPTH = 1;
  static constexpr size_t MAX_FLATTEN_MAX_DEPTH = 100;
  static constexpr size_t MIN_FLATTEN_MAX_ARRAY_WIDTH = 1;
  static constexpr size_t MAX_FLATTEN_MAX_ARRAY_WIDTH = 10000;

  static void setBatchSize(size_t v) {
    checkRange("BATCH_SIZE", v, MIN_BATCH_SIZE, MAX_BATCH_SIZE);
    BATCH_SIZE = v;
  }
  static size_t getBatchSize() { return BATCH_SIZE; }

  static void setMaxRecordedErrors(size_t v) {
    checkRange("MAX_RECORDED_ERRORS", v, MIN_RECORDED_ERRORS,
               MAX_RECORDED_ERRORS_LIMIT);
    MAX_RECORDED_ERRORS = v;
  }
  static size_t getMaxRecordedErrors() { return MAX_RECORDED_ERRORS; }

  static void setCsvSampleSize(size_t v) {
    checkRange("CSV_SAMPLE_SIZE", v, MIN_CSV_SAMPLE_SIZE, MAX_CSV_SAMPLE_SIZE);
    CSV_SAMPLE_SIZE = v;
  }
  static size_t getCsvSampleSize() { return CSV_SAMPLE_SIZE; }

  static void setProgressCapacity(size_t v) {
    checkRange("PROGRESS_CAPACITY", v, MIN_PROGRESS_CAPACITY,
               MAX_PROGRESS_CAPACITY);
    PROGRESS_CAPACITY = v;
  }
  static size_t getProgressCapacity() { return PROGRESS_CAPACITY; }

  static void setMaxWorkers(size_t v) {
    checkRange("MAX_WORKERS", v, MIN_MAX_WORKERS, MAX_MAX_WORKERS);
    MAX_WORKERS = v;
  }
  static size_t getMaxWorkers() { return MAX_WORKERS; }

  static void setFlattenMaxDepth(size_t v) {
    checkRange("FLATTEN_MAX_DEPTH", v, MIN_FLATTEN_MAX_DEPTH,
               MAX_FLATTEN_MAX_DEPTH);
    FLATTEN_MAX_DEPTH = v;
  }
  static size_t getFlattenMaxDepth() { return FLATTEN_MAX_DEPTH; }

  static void setFlattenMaxArrayWidth(size_t v) {
    checkRange("FLATTEN_MAX_ARRAY_WIDTH", v, MIN_FLATTEN_MAX_ARRAY_WIDTH,
               MAX_FLATTEN_MAX_ARRAY_WIDTH);
    FLATTEN_MAX_ARRAY_WIDTH = v;
  }
  static size_t getFlattenMaxArrayWidth() { return FLATTEN_MAX_ARRAY_WIDTH; }

  static void resetDefaults();

private:
  static void checkRange(const char *name, size_t v, size_t lo, size_t hi) {
    if (v < lo || v > hi) {
      throw std::invalid_argument(std::string(name) + " must be between " +
                                  std::to_string(lo) + " and " +
                                  std::to_string(hi));
    }
  }
};

#endif
