#include "../include/localocr/ocr_bridge.hpp"
#include "../include/localocr/errors.hpp"
#include "../include/localocr/log.hpp"

#include <exception>
#include <utility>
#include <vector>

namespace localocr {

std::string join_lines(const std::vector<std::string>& lines) {
    std::string joined;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined.push_back('\n');
        }
        joined += lines[i];
    }
    return joined;
}

OcrEngineBridge::OcrEngineBridge(ocr::TextRecognizer& recognizer)
    : m_recognizer(recognizer), m_worker([this] { worker_loop(); }) {}

OcrEngineBridge::~OcrEngineBridge() {
    std::deque<Job> abandoned;
    {
        std::scoped_lock lock(m_mutex);
        m_stopping = true;
        abandoned.swap(m_jobs);
    }
    m_cv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
    for (auto& job : abandoned) {
        job.promise.set_exception(std::make_exception_ptr(
            ToolError(ErrorKind::ProcessingFailed, "OCR processing failed: server is shutting down")));
    }
}

std::future<std::string> OcrEngineBridge::submit(ocr::OcrRequest request) {
    Job job;
    job.request = std::move(request);
    std::future<std::string> result = job.promise.get_future();
    {
        std::scoped_lock lock(m_mutex);
        if (m_stopping) {
            throw std::runtime_error("OCR worker is not running");
        }
        m_jobs.push_back(std::move(job));
    }
    m_cv.notify_one();
    return result;
}

std::string OcrEngineBridge::run(ocr::OcrRequest request) {
    return submit(std::move(request)).get();
}

void OcrEngineBridge::worker_loop() {
    for (;;) {
        Job job;
        {
            std::unique_lock lock(m_mutex);
            m_cv.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });
            if (m_stopping) {
                return;
            }
            job = std::move(m_jobs.front());
            m_jobs.pop_front();
        }
        execute(job);
    }
}

void OcrEngineBridge::execute(Job& job) {
    std::vector<std::string> lines;
    try {
        lines = m_recognizer.recognize(job.request);
    } catch (const ToolError&) {
        job.promise.set_exception(std::current_exception());
        return;
    } catch (const std::exception& ex) {
        log_error("OCR", std::string("engine failure: ") + ex.what());
        job.promise.set_exception(std::make_exception_ptr(
            ToolError(ErrorKind::ProcessingFailed, std::string("OCR processing failed: ") + ex.what())));
        return;
    } catch (...) {
        log_error("OCR", "engine failure: unknown exception");
        job.promise.set_exception(std::make_exception_ptr(
            ToolError(ErrorKind::ProcessingFailed, "OCR processing failed: unknown engine error")));
        return;
    }

    if (lines.empty()) {
        job.promise.set_exception(
            std::make_exception_ptr(ToolError(ErrorKind::NoTextFound, "No text was found in the image")));
        return;
    }
    job.promise.set_value(join_lines(lines));
}

} // namespace localocr
