#pragma once

#include "ocr/engine.hpp"

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace localocr {

// Runs a blocking recognizer on one dedicated worker thread. Every submitted
// job completes its future exactly once: joined text, or a ToolError of kind
// NoTextFound / ProcessingFailed. Jobs are executed one at a time in
// submission order; nothing is retried.
class OcrEngineBridge {
public:
    explicit OcrEngineBridge(ocr::TextRecognizer& recognizer);
    ~OcrEngineBridge();

    OcrEngineBridge(const OcrEngineBridge&) = delete;
    OcrEngineBridge& operator=(const OcrEngineBridge&) = delete;

    std::future<std::string> submit(ocr::OcrRequest request);

    // Blocks the calling thread, never the worker's queue.
    std::string run(ocr::OcrRequest request);

    std::thread::id worker_id() const noexcept { return m_worker.get_id(); }

private:
    struct Job {
        ocr::OcrRequest request;
        std::promise<std::string> promise;
    };

    ocr::TextRecognizer& m_recognizer;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Job> m_jobs;
    bool m_stopping = false;
    std::thread m_worker;

    void worker_loop();
    void execute(Job& job);
};

// Lines joined by '\n' in engine order.
std::string join_lines(const std::vector<std::string>& lines);

} // namespace localocr
