/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

/*
 * textvault_cat: stream a text file to stdout through the engine.
 *
 *   textvault_cat big.log                       # decoded text on stdout, progress on stderr
 *   textvault_cat --analyze big.log             # size category and line estimate
 *   textvault_cat --search ERROR big.log        # offsets of segments containing a term
 *   textvault_cat --copy-to out.txt big.log     # stream into an atomic save
 */

#include "../src/file_analyzer.h"
#include "../src/persistence/atomic_writer.h"
#include "../src/streaming_engine.h"
#include "../src/util/log.h"
#include "../src/util/logmanager.h"

#include <boost/program_options.hpp>

#include <cstdio>
#include <iostream>
#include <memory>

namespace po = boost::program_options;
using namespace textvault;

namespace {

    CancellationSource g_cancel;

    int exit_code(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::None:             return 0;
            case ErrorKind::InvalidInput:     return 2;
            case ErrorKind::NotFound:         return 3;
            case ErrorKind::PermissionDenied: return 4;
            case ErrorKind::Cancelled:        return 130;
            default:                          return 1;
        }
    }

    int run_analyze(const EngineConfig& config, const std::string& path) {
        FileAnalyzer analyzer(config);
        Result<StreamingFileInfo> r = analyzer.analyze(path);
        if (!r) {
            std::cerr << "analyze failed: " << r.error().message << std::endl;
            return exit_code(r.kind());
        }
        std::cout << "path:             " << r->file_path << "\n"
                  << "size:             " << FileAnalyzer::format_bytes(r->file_size) << "\n"
                  << "category:         " << to_string(r->category) << "\n"
                  << "recommendation:   " << to_string(r->recommendation) << "\n"
                  << "streaming:        " << (r->requires_streaming ? "yes" : "no") << "\n"
                  << "~lines:           " << r->estimated_line_count << "\n"
                  << "~memory:          " << FileAnalyzer::format_bytes(r->estimated_memory_bytes) << "\n"
                  << "~load time:       " << r->estimated_load_time.count() << " ms" << std::endl;
        return 0;
    }

    int run_search(StreamingEngine& engine, const std::string& path, const std::string& term) {
        auto r = engine.search(path, term, false, g_cancel.token());
        if (!r) {
            std::cerr << "search failed: " << r.error().message << std::endl;
            return exit_code(r.kind());
        }
        for (const TextSegment& seg : r.value()) {
            std::cout << seg.start_position << "\t" << seg.length << std::endl;
        }
        return r->empty() ? 1 : 0;
    }

    int run_copy(const EngineConfig& config, StreamingEngine& engine,
                 const std::string& path, const std::string& dest) {
        SegmentStream s = engine.stream(path, nullptr, g_cancel.token());
        persist::AtomicWriter writer(config);

        FileAnalyzer analyzer(config);
        auto fi = analyzer.analyze(path);
        uint64_t hint = fi ? fi->file_size : 0;

        Result<void> saved = writer.save_streaming(
            dest,
            [&s]() -> std::optional<std::string> {
                std::optional<TextSegment> seg = s.next();
                if (!seg) return std::nullopt;
                return std::move(seg->content);
            },
            {}, hint, g_cancel.token());

        if (!s.status()) {
            std::cerr << "read failed: " << s.status().error().message << std::endl;
            return exit_code(s.status().kind());
        }
        if (!saved) {
            std::cerr << "save failed: " << saved.error().message << std::endl;
            return exit_code(saved.kind());
        }
        return 0;
    }

    int run_cat(StreamingEngine& engine, const std::string& path, bool quiet) {
        int last_pct = -1;
        ProgressCallback progress;
        if (!quiet) {
            progress = [&last_pct](const ProgressEvent& ev) {
                int pct = static_cast<int>(ev.percent_complete);
                if (pct != last_pct) {
                    last_pct = pct;
                    std::fprintf(stderr, "\r%3d%% (%llu / %llu bytes)", pct,
                                 static_cast<unsigned long long>(ev.processed_bytes),
                                 static_cast<unsigned long long>(ev.total_bytes));
                }
            };
        }

        SegmentStream s = engine.stream(path, progress, g_cancel.token());
        size_t links = 0;
        for (const TextSegment& seg : s) {
            std::fwrite(seg.content.data(), 1, seg.content.size(), stdout);
            links += seg.hyperlinks.size();
        }
        std::fflush(stdout);
        if (!quiet) {
            std::fprintf(stderr, "\n%zu hyperlink(s)\n", links);
        }

        if (!s.status()) {
            std::cerr << "stream failed: " << s.status().error().message << std::endl;
            return exit_code(s.status().kind());
        }
        return 0;
    }

} // namespace

int main(int argc, char** argv) {
    initLoggingFromEnv();

    po::options_description desc("Usage: textvault_cat [options] <file>");
    desc.add_options()
        ("help,h", "show this message")
        ("analyze,a", "print size analysis instead of content")
        ("search,s", po::value<std::string>(), "list segments containing a term")
        ("copy-to,c", po::value<std::string>(), "stream the file into an atomic save at this path")
        ("chunk-size", po::value<size_t>(), "bytes per segment")
        ("log-dir", po::value<std::string>(), "write the log to <dir>/textvault.log")
        ("quiet,q", "no progress output");

    po::options_description hidden;
    hidden.add_options()("file", po::value<std::string>(), "input file");

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description pos;
    pos.add("file", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).positional(pos).run(), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << "\n" << desc << std::endl;
        return 2;
    }

    if (vm.count("help") || !vm.count("file")) {
        std::cout << desc << std::endl;
        return vm.count("help") ? 0 : 2;
    }

    std::unique_ptr<LogManager> log_manager;
    try {
        if (vm.count("log-dir")) {
            log_manager.reset(new LogManager(vm["log-dir"].as<std::string>()));
        }

        EngineConfig config = EngineConfig::defaults();
        if (vm.count("chunk-size")) {
            config.chunk_size = vm["chunk-size"].as<size_t>();
        }

        InterruptCanceller interrupt(g_cancel);

        const std::string path = vm["file"].as<std::string>();
        if (vm.count("analyze")) {
            return run_analyze(config, path);
        }

        StreamingEngine engine(config);
        if (vm.count("search")) {
            return run_search(engine, path, vm["search"].as<std::string>());
        }
        if (vm.count("copy-to")) {
            return run_copy(config, engine, path, vm["copy-to"].as<std::string>());
        }
        return run_cat(engine, path, vm.count("quiet") > 0);
    } catch (const std::exception& e) {
        severe() << "textvault_cat: " << e.what();
        std::cerr << "textvault_cat: " << e.what() << std::endl;
        return 1;
    }
}
