#include "Certificate.hpp"
#include "HttpClient.hpp"
#include "Logger.hpp"
#include "RevocationChecker.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace revcheck {

namespace {
    constexpr int EXIT_ALL_GOOD = 0;
    constexpr int EXIT_REVOKED = 1;
    constexpr int EXIT_USAGE = 2;
    constexpr int EXIT_UNKNOWN = 3;

    struct CommandLine {
        CheckerOptions options;
        std::string localCrl;
        std::string logFile;
        LogLevel logLevel = LogLevel::Warning;
        bool quiet = false;
        long timeoutSeconds = RevocationParameters::DEFAULT_TIMEOUT_SECONDS;
        std::vector<std::string> certificates;
    };

    void printUsage(const char* program) {
        std::cout
            << "Usage: " << program << " [options] <certificate-file>...\n"
            << "\n"
            << "Checks each certificate (PEM or DER) against its CRLs and OCSP responders.\n"
            << "\n"
            << "Options:\n"
            << "  --hard-fail              treat a failed check as revoked\n"
            << "  --local-crl <path|uri>   check against this CRL file first\n"
            << "  --require-verified-crl   reject CRLs whose issuer cannot be fetched\n"
            << "  --timeout <seconds>      network timeout (default "
            << RevocationParameters::DEFAULT_TIMEOUT_SECONDS << ")\n"
            << "  --log-file <path>        append log output to a file\n"
            << "  --log-level <level>      debug, info, warning or error (default warning)\n"
            << "  --quiet                  no log output on stderr\n"
            << "  --help                   show this text\n";
    }

    LogLevel parseLogLevel(const std::string& value) {
        if (value == "debug") return LogLevel::Debug;
        if (value == "info") return LogLevel::Info;
        if (value == "warning") return LogLevel::Warning;
        if (value == "error") return LogLevel::Error;
        throw std::invalid_argument("Unknown log level: " + value);
    }

    long parseTimeout(const std::string& value) {
        long seconds = 0;
        try {
            seconds = std::stol(value);
        }
        catch (const std::exception&) {
            throw std::invalid_argument("Invalid timeout: " + value);
        }
        if (seconds <= 0) {
            throw std::invalid_argument("Timeout must be positive");
        }
        return seconds;
    }

    CommandLine parseCommandLine(int argc, char* argv[]) {
        CommandLine cmd;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto nextValue = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument(arg + " requires a value");
                }
                return argv[++i];
            };

            if (arg == "--hard-fail") {
                cmd.options.hardFail = true;
            } else if (arg == "--require-verified-crl") {
                cmd.options.requireVerifiedCrl = true;
            } else if (arg == "--local-crl") {
                cmd.localCrl = nextValue();
            } else if (arg == "--timeout") {
                cmd.timeoutSeconds = parseTimeout(nextValue());
            } else if (arg == "--log-file") {
                cmd.logFile = nextValue();
            } else if (arg == "--log-level") {
                cmd.logLevel = parseLogLevel(nextValue());
            } else if (arg == "--quiet") {
                cmd.quiet = true;
            } else if (!arg.empty() && arg[0] == '-') {
                throw std::invalid_argument("Unknown option: " + arg);
            } else {
                cmd.certificates.push_back(arg);
            }
        }

        if (cmd.certificates.empty()) {
            throw std::invalid_argument("No certificate files given");
        }
        return cmd;
    }

    std::shared_ptr<const X509Certificate> loadCertificate(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            throw RevocationError(ErrorCode::IOError, "Cannot open " + path);
        }
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                                  std::istreambuf_iterator<char>());
        return X509Certificate::parse(data);
    }
}

} // namespace revcheck

int main(int argc, char* argv[]) {
    using namespace revcheck;

    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help") {
            printUsage(argv[0]);
            return EXIT_ALL_GOOD;
        }
    }

    CommandLine cmd;
    try {
        cmd = parseCommandLine(argc, argv);
    }
    catch (const std::exception& e) {
        std::cerr << argv[0] << ": " << e.what() << "\n";
        printUsage(argv[0]);
        return EXIT_USAGE;
    }

    // Configure logging
    Logger::setLogLevel(cmd.logLevel);
    Logger::enableConsoleOutput(!cmd.quiet);
    if (!cmd.logFile.empty()) {
        Logger::setLogFile(cmd.logFile);
    }

    try {
        auto http = std::make_shared<CurlHttpClient>(std::chrono::seconds(cmd.timeoutSeconds));
        RevocationChecker checker(cmd.options, http);

        if (!cmd.localCrl.empty()) {
            checker.setLocalCRL(cmd.localCrl);
        }

        int exitCode = EXIT_ALL_GOOD;
        for (const auto& path : cmd.certificates) {
            RevocationResult result;
            try {
                result = checker.check(*loadCertificate(path));
            }
            catch (const RevocationError& e) {
                Logger::logError(e.code(), "Cannot load " + path + ": " + e.what());
                std::cout << path << ": unreadable\n";
                if (exitCode != EXIT_REVOKED) {
                    exitCode = EXIT_USAGE;
                }
                continue;
            }

            std::cout << path << ": " << toString(result) << "\n";
            if (result.revoked) {
                exitCode = EXIT_REVOKED;
            } else if (!result.ok && exitCode == EXIT_ALL_GOOD) {
                exitCode = EXIT_UNKNOWN;
            }
        }

        Logger::flush();
        return exitCode;
    }
    catch (const RevocationError& e) {
        Logger::logError(e.code(), std::string("Fatal error: ") + e.what());
        std::cerr << argv[0] << ": " << e.what() << "\n";
        Logger::flush();
        return EXIT_USAGE;
    }
    catch (const std::exception& e) {
        Logger::logError(ErrorCode::InternalError, std::string("Fatal error: ") + e.what());
        Logger::flush();
        return EXIT_USAGE;
    }
}
