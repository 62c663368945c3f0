#include "CarveCommand.h"
#include "ByteSource.h"
#include "DefaultSignatures.h"
#include "DirectoryArtifactSink.h"
#include "ReportWriter.h"
#include "ProgressBar.h"
#include "Logger.h"
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <map>
#include <memory>

namespace {

// 当前正在运行的扫描（用于 Ctrl+C 取消）
atomic<CarveRunner*> activeRunner(nullptr);

constexpr ULONGLONG MiB = 1024ULL * 1024;

bool ParseNumber(const string& text, ULONGLONG& value) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long parsed = strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    value = parsed;
    return true;
}

vector<string> SplitTypes(const string& list) {
    vector<string> types;
    string current;
    for (char c : list) {
        if (c == ',') {
            if (!current.empty()) types.push_back(current);
            current.clear();
        } else if (!isspace(static_cast<unsigned char>(c))) {
            current.push_back(c);
        }
    }
    if (!current.empty()) types.push_back(current);
    return types;
}

RC::Result<CommandLineOptions> UsageError(const string& message) {
    return RC::Result<CommandLineOptions>::Failure(RC::ErrorCode::LogicInvalidArgument, message);
}

} // namespace

// ============================================================================
// 参数解析
// ============================================================================
RC::Result<CommandLineOptions> CarveCommand::ParseArguments(const vector<string>& args) {
    CommandLineOptions options;

    if (args.empty() || args[0] == "help" || args[0] == "--help" || args[0] == "-h") {
        options.command = "help";
        return RC::Result<CommandLineOptions>::Success(options);
    }

    options.command = args[0];
    if (options.command != "carve" && options.command != "types") {
        return UsageError("unknown command '" + options.command + "'");
    }

    for (size_t i = 1; i < args.size(); i++) {
        const string& arg = args[i];

        // 需要值的选项
        auto needValue = [&](string& value) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            value = args[++i];
            return true;
        };

        string value;
        ULONGLONG number = 0;

        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--no-extract") {
            options.extract = false;
        } else if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
        } else if (arg == "--catalog") {
            if (!needValue(options.catalogPath)) return UsageError("--catalog requires a path");
        } else if (arg == "--log") {
            if (!needValue(options.logPath)) return UsageError("--log requires a path");
        } else if (options.command == "types") {
            return UsageError("unknown option '" + arg + "' for types");
        } else if (arg == "--input" || arg == "-i") {
            if (!needValue(options.inputPath)) return UsageError("--input requires a path");
        } else if (arg == "--output" || arg == "-o") {
            if (!needValue(options.outputDir)) return UsageError("--output requires a directory");
        } else if (arg == "--report") {
            if (!needValue(options.reportPath)) return UsageError("--report requires a path");
        } else if (arg == "--types") {
            if (!needValue(value)) return UsageError("--types requires a list");
            options.types = SplitTypes(value);
            if (options.types.empty()) return UsageError("--types list is empty");
        } else if (arg == "--chunk-size") {
            if (!needValue(value) || !ParseNumber(value, number) || number == 0 || number > 4096) {
                return UsageError("--chunk-size requires a size in MiB (1-4096)");
            }
            options.chunkSizeMiB = static_cast<size_t>(number);
        } else if (arg == "--segment-size") {
            if (!needValue(value) || !ParseNumber(value, number) || number == 0) {
                return UsageError("--segment-size requires a positive size in MiB");
            }
            options.segmentSizeMiB = number;
        } else if (arg == "--threads") {
            if (!needValue(value) || !ParseNumber(value, number) || number > 256) {
                return UsageError("--threads requires a count (0 = auto)");
            }
            options.threads = static_cast<int>(number);
        } else if (arg == "--max-results") {
            if (!needValue(value) || !ParseNumber(value, number)) {
                return UsageError("--max-results requires a count");
            }
            options.maxResults = static_cast<size_t>(number);
        } else {
            return UsageError("unknown option '" + arg + "'");
        }
    }

    if (options.command == "carve") {
        if (options.inputPath.empty()) {
            return UsageError("carve requires --input");
        }
        if (options.extract && options.outputDir.empty()) {
            return UsageError("carve requires --output (or --no-extract)");
        }
    }

    return RC::Result<CommandLineOptions>::Success(options);
}

// ============================================================================
// 配置
// ============================================================================
RC::Result<SignatureCatalog> CarveCommand::LoadCatalog(const CommandLineOptions& options,
                                                       CatalogConfig& configOut) {
    if (!options.catalogPath.empty()) {
        auto loaded = CatalogLoader::LoadFromFile(options.catalogPath);
        if (loaded.IsFailure()) {
            return loaded.ForwardError<SignatureCatalog>();
        }
        configOut = loaded.TakeValue();
    } else {
        configOut = CatalogConfig();
    }

    auto catalog = configOut.BuildCatalog();
    if (catalog.IsFailure() || options.types.empty()) {
        return catalog;
    }
    return catalog.Value().Select(options.types);
}

CarveRunConfig CarveCommand::BuildRunConfig(const CommandLineOptions& options,
                                            const EngineSettings& settings) {
    CarveRunConfig config;

    if (settings.chunkSize) config.chunkSize = *settings.chunkSize;
    if (settings.workers) config.workerCount = *settings.workers;
    if (settings.segmentSize) config.segmentSize = *settings.segmentSize;

    if (options.chunkSizeMiB) config.chunkSize = static_cast<size_t>(*options.chunkSizeMiB * MiB);
    if (options.threads) config.workerCount = *options.threads;
    if (options.segmentSizeMiB) config.segmentSize = *options.segmentSizeMiB * MiB;
    if (options.maxResults) config.maxResults = *options.maxResults;

    config.extract = options.extract;
    return config;
}

// ============================================================================
// 命令分发
// ============================================================================
int CarveCommand::Execute(const CommandLineOptions& options, ostream& out) {
    if (options.command == "carve") {
        return ExecuteCarve(options, out);
    }
    if (options.command == "types") {
        return ExecuteTypes(options, out);
    }
    PrintUsage(out);
    return EXIT_OK;
}

void CarveCommand::PrintUsage(ostream& out) {
    out << "RawCarve - signature-based file carving for raw disk images\n" << endl;
    out << "Usage:" << endl;
    out << "  rawcarve carve --input <image> --output <dir> [options]" << endl;
    out << "  rawcarve types [--catalog <json>]" << endl;
    out << "  rawcarve help" << endl;
    out << "\nCarve options:" << endl;
    out << "  --catalog <json>        Signature catalog (default: built-in table)" << endl;
    out << "  --types a,b,...         Only carve the listed type ids" << endl;
    out << "  --chunk-size <MiB>      Read chunk size (default 8)" << endl;
    out << "  --threads <n>           Worker threads; 1 = sequential, 0 = auto" << endl;
    out << "  --segment-size <MiB>    Segment size for parallel scans (default 256)" << endl;
    out << "  --max-results <n>       Stop after n carved files" << endl;
    out << "  --no-extract            Report ranges only, do not write files" << endl;
    out << "  --report <json>         Write a JSON run report" << endl;
    out << "  --log <file>            Log file (default rawcarve.log)" << endl;
    out << "  --verbose               Debug logging" << endl;
    out << "  --quiet                 No progress bar" << endl;
    out << "\nExamples:" << endl;
    out << "  rawcarve carve --input disk.img --output recovered/" << endl;
    out << "  rawcarve carve --input disk.img --output out/ --types jpeg-jfif,png --threads 0" << endl;
}

// ============================================================================
// types
// ============================================================================
int CarveCommand::ExecuteTypes(const CommandLineOptions& options, ostream& out) {
    CatalogConfig config;
    auto catalog = LoadCatalog(options, config);
    if (catalog.IsFailure()) {
        out << "Error: " << catalog.Error().ToString() << endl;
        return EXIT_USAGE;
    }

    const SignatureCatalog& sigs = catalog.Value();

    out << "\n=== Supported File Types (" << sigs.Size() << ") ===\n" << endl;
    out << left << setw(14) << "TYPE" << setw(6) << "EXT" << setw(19) << "POLICY"
        << setw(12) << "MAX SIZE" << "HEADER / FOOTER" << endl;

    for (const auto& def : sigs.LookupHeaders()) {
        string maxSize = (def.maxSize == UNBOUNDED_SIZE) ? "-" : ProgressBar::FormatBytes(def.maxSize);
        out << left << setw(14) << def.typeId << setw(6) << def.Extension()
            << setw(19) << SizePolicyName(def.sizePolicy) << setw(12) << maxSize;

        string header = def.header.ToString();
        if (header.size() > 48) {
            header = header.substr(0, 45) + "...";
        }
        out << header;
        if (def.HasFooter()) {
            out << " / " << def.footer.ToString() << " (" << FooterModeName(def.footerMode) << ")";
        }
        out << endl;
    }
    out << right;

    out << "\nUse 'rawcarve carve --types <a,b>' to restrict a scan." << endl;
    return EXIT_OK;
}

// ============================================================================
// carve
// ============================================================================
int CarveCommand::ExecuteCarve(const CommandLineOptions& options, ostream& out) {
    CatalogConfig config;
    auto catalog = LoadCatalog(options, config);
    if (catalog.IsFailure()) {
        out << "Error: " << catalog.Error().ToString() << endl;
        return EXIT_USAGE;
    }

    auto opened = FileByteSource::Open(options.inputPath);
    if (opened.IsFailure()) {
        out << "Error: " << opened.Error().ToString() << endl;
        return EXIT_USAGE;
    }
    unique_ptr<FileByteSource> source = opened.TakeValue();

    unique_ptr<DirectoryArtifactSink> sink;
    if (options.extract) {
        auto created = DirectoryArtifactSink::Create(options.outputDir);
        if (created.IsFailure()) {
            out << "Error: " << created.Error().ToString() << endl;
            return EXIT_USAGE;
        }
        sink = created.TakeValue();
    }

    CarveRunConfig runConfig = BuildRunConfig(options, config.engine);
    CarveRunner runner(catalog.Value(), runConfig);

    out << "Scanning " << options.inputPath << " (" << ProgressBar::FormatBytes(source->Length())
        << ") for " << catalog.Value().Size() << " file types..." << endl;

    unique_ptr<ProgressBar> progress;
    if (!options.quiet) {
        progress.reset(new ProgressBar(source->Length(), 40, out));
        ProgressBar* bar = progress.get();
        runner.SetProgressCallback([bar](ULONGLONG done, ULONGLONG, ULONGLONG found) {
            bar->Update(done, found);
        });
    }

    activeRunner = &runner;
    auto result = runner.Run(*source, sink.get());
    activeRunner = nullptr;

    if (progress) {
        progress->Finish();
        progress.reset();
    }

    if (result.IsFailure()) {
        out << "Error: " << result.Error().ToString() << endl;
        return EXIT_USAGE;
    }

    const CarveReport& report = result.Value();

    // ==================== 汇总 ====================
    map<string, size_t> perType;
    for (const auto& file : report.files) {
        perType[file.typeId]++;
    }

    out << "\n=== Carving Summary ===" << endl;
    out << "Bytes scanned:     " << ProgressBar::FormatNumber(report.bytesScanned) << endl;
    out << "Files carved:      " << report.files.size() << endl;
    for (const auto& entry : perType) {
        out << "  " << left << setw(14) << entry.first << right << entry.second << endl;
    }
    out << "Sessions discarded: " << report.stats.tracker.sessionsDiscarded << endl;
    if (!report.failures.empty()) {
        out << "Extraction failures: " << report.failures.size() << endl;
        for (const auto& failure : report.failures) {
            out << "  " << failure.typeId << " @" << failure.startOffset << ": "
                << failure.error.ToString() << endl;
        }
    }
    if (report.truncated) {
        out << "Result limit reached; scan stopped early." << endl;
    }
    if (report.cancelled) {
        out << "Scan cancelled." << endl;
    }
    if (report.aborted) {
        out << "Scan aborted: " << report.abortError.ToString() << endl;
    }
    if (options.extract) {
        out << "Output directory:  " << options.outputDir << endl;
    }

    if (!options.reportPath.empty()) {
        auto written = ReportWriter::WriteJson(report, options.reportPath);
        if (written.IsFailure()) {
            out << "Warning: " << written.Error().ToString() << endl;
        } else {
            out << "Report written:    " << options.reportPath << endl;
        }
    }

    if (report.aborted) {
        return EXIT_SCAN_ABORTED;
    }
    if (!report.failures.empty()) {
        return EXIT_PARTIAL;
    }
    return EXIT_OK;
}

void CarveCommand::RequestStop() {
    CarveRunner* runner = activeRunner.load();
    if (runner != nullptr) {
        runner->StopScanning();
    }
}
