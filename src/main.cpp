#include "Config.hpp"
#include "Errors.hpp"
#include "Recorder.hpp"
#include "Sweep.hpp"
#include "Types.hpp"
#include <exception>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    CommandLine commandLine;
    try {
        commandLine = parseArguments(argc, argv);
    } catch (const ConfigurationError& e) {
        std::cerr << e.what() << '\n' << usage(argv[0]);
        return 1;
    }
    if (commandLine.help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    const SweepConfig& sweep = commandLine.sweep;
    try {
        Recorder recorder(sweep.outputDir, sweep.name, sweep.compress);
        SweepSummary summary = runSweep(sweep, recorder);
        std::string outputPath = recorder.close();

        std::cout << "Wrote " << summary.completed << " records to " << outputPath << '\n';
        if (summary.failed > 0) {
            std::cerr << summary.failed << " configurations failed" << '\n';
            return 2;
        }
    } catch (const SimulationError& e) {
        std::cerr << "Sweep aborted: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Sweep aborted by an unexpected error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
