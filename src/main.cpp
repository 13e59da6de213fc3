#include "omr/BatchScorer.hpp"
#include "omr/Config.hpp"
#include "omr/SampleSheet.hpp"
#include "omr/SheetProcessor.hpp"

#include <opencv2/opencv.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <memory>
#include <cstdlib>

namespace fs = std::filesystem;

static void usage() {
    std::cout << "usage: omrscore [--config FILE] --key FILE [--jobs N] [--debug-dir DIR]\n"
              << "                [--report FILE] [--verbose] IMAGE...\n"
              << "       omrscore [--config FILE] --sample OUT.png\n";
}

static bool readBytes(const std::string& path, std::vector<uchar>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

static void writeReportFile(const std::string& path, const std::vector<omr::BatchEntry>& entries) {
    YAML::Node root;
    for (const auto& e : entries) {
        YAML::Node n;
        n["file"] = e.name;
        n["ok"] = e.result.ok;
        if (e.result.ok) {
            n["report"] = omr::reportToYaml(e.result.report);
        } else {
            n["error"] = omr::toCStr(e.result.error);
            n["stage"] = omr::toCStr(e.result.stage);
            n["message"] = e.result.message;
        }
        root.push_back(n);
    }

    YAML::Emitter out;
    out.SetDoublePrecision(17);
    out << root;

    std::ofstream f(path);
    f << out.c_str() << "\n";
    if (!f) spdlog::error("could not write report '{}'", path);
}

int main(int argc, char** argv) {
    std::string configPath, keyPath, debugDir, reportPath, samplePath;
    int jobs = 0;
    std::vector<std::string> images;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                std::cerr << a << " needs a value\n";
                std::exit(1);
            }
            return argv[++i];
        };

        if (a == "--config") configPath = next();
        else if (a == "--key") keyPath = next();
        else if (a == "--jobs") jobs = std::atoi(next().c_str());
        else if (a == "--debug-dir") debugDir = next();
        else if (a == "--report") reportPath = next();
        else if (a == "--sample") samplePath = next();
        else if (a == "--verbose") spdlog::set_level(spdlog::level::debug);
        else if (a == "-h" || a == "--help") { usage(); return 0; }
        else if (!a.empty() && a[0] == '-') {
            std::cerr << "unknown option " << a << "\n";
            usage();
            return 1;
        }
        else images.push_back(a);
    }

    omr::PipelineConfig cfg;
    omr::AnswerKey key;
    try {
        if (!configPath.empty()) {
            cfg = omr::loadConfig(configPath);
        } else {
            cfg.layout = omr::Layout::standard();
        }
        if (!debugDir.empty()) cfg.renderDebug = true;

        if (!samplePath.empty()) {
            cv::Mat sheet = omr::SampleSheet::render(cfg.layout);
            if (!cv::imwrite(samplePath, sheet)) {
                std::cerr << "could not write " << samplePath << "\n";
                return 1;
            }
            std::cout << "sample sheet written to " << samplePath << "\n";
            return 0;
        }

        if (keyPath.empty() || images.empty()) {
            usage();
            return 1;
        }
        key = omr::loadAnswerKey(keyPath, cfg.layout);
    } catch (const omr::OmrError& e) {
        std::cerr << omr::toCStr(e.kind()) << ": " << e.what() << "\n";
        return 1;
    } catch (const cv::Exception& e) {
        std::cerr << "OpenCV: " << e.what() << "\n";
        return 1;
    }

    std::vector<omr::BatchItem> items;
    for (const auto& path : images) {
        omr::BatchItem item;
        item.name = path;
        if (!readBytes(path, item.bytes)) {
            // an unreadable file becomes a DecodeError entry like any bad image
            spdlog::warn("{} could not be read", path);
        }
        items.push_back(std::move(item));
    }

    std::unique_ptr<omr::SheetProcessor> processor;
    try {
        processor = std::make_unique<omr::SheetProcessor>(cfg);
    } catch (const omr::OmrError& e) {
        std::cerr << omr::toCStr(e.kind()) << ": " << e.what() << "\n";
        return 1;
    }

    omr::BatchScorer batch(*processor, jobs);
    std::vector<omr::BatchEntry> entries = batch.run(items, key);

    bool anyFail = false;
    for (const auto& e : entries) {
        const omr::SheetResult& r = e.result;
        if (r.ok) {
            std::cout << e.name << " " << std::fixed << std::setprecision(2)
                      << r.report.percentage << "%\n";
        } else {
            anyFail = true;
            std::cout << e.name << " FAILED " << omr::toCStr(r.error) << " at "
                      << omr::toCStr(r.stage) << ": " << r.message << "\n";
        }

        if (!debugDir.empty() && !r.debugImage.empty()) {
            std::error_code ec;
            fs::create_directories(debugDir, ec);
            fs::path out = fs::path(debugDir) / (fs::path(e.name).stem().string() + "_debug.png");
            if (!cv::imwrite(out.string(), r.debugImage)) {
                spdlog::warn("could not write debug image {}", out.string());
            }
        }
    }

    for (const auto& e : entries) {
        if (!e.result.ok) continue;
        std::cout << "\n" << e.name << "\n" << omr::formatSummary(e.result.report);
    }

    std::cout << "\n" << omr::formatBatchSummary(omr::summarize(entries));

    if (!reportPath.empty()) writeReportFile(reportPath, entries);

    return anyFail ? 2 : 0;
}
