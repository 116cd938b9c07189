// ferryc translates a type checker's JSON type graph dump into an interface description.
#include "ferry/ErrorReporter.hpp"
#include "ferry/SchemaEmitter.hpp"
#include "ferry/SchemaJSON.hpp"
#include "ferry/SourceFile.hpp"
#include "ferry/Translator.hpp"
#include "ferry/TypeGraphJSON.hpp"

#include "fmt/format.h"
#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <fstream>
#include <iostream>
#include <memory>
#include <string>

DEFINE_string(inputFile, "", "path to the JSON type graph to translate");
DEFINE_string(outputFile, "", "path to write the interface description to, standard output if empty");
DEFINE_string(format, "did", "output format, 'did' for interface description text or 'json'");
DEFINE_string(logLevel, "warn", "log level: trace, debug, info, warn, error, critical or off");

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("ferryc --inputFile=graph.json [--outputFile=out.did] [--format=did|json]");
    gflags::ParseCommandLineFlags(&argc, &argv, false);
    spdlog::set_level(spdlog::level::from_str(FLAGS_logLevel));

    if (FLAGS_format != "did" && FLAGS_format != "json") {
        spdlog::error("Unknown output format '{}', expected 'did' or 'json'.", FLAGS_format);
        return -1;
    }

    auto errorReporter = std::make_shared<ferry::ErrorReporter>();
    errorReporter->setFileName(FLAGS_inputFile);
    ferry::SourceFile file(FLAGS_inputFile);
    if (!file.read(errorReporter.get())) {
        return -1;
    }

    ferry::TypeGraphJSON loader(errorReporter);
    if (!loader.parse(file.codeView()) || !errorReporter->ok()) {
        return -1;
    }

    ferry::Translator translator(errorReporter);
    auto program = translator.translateProgram(loader.constructors(), loader.entryPoints(), loader.actor());
    if (!program || !errorReporter->ok()) {
        return -1;
    }

    std::string output;
    if (FLAGS_format == "json") {
        if (!ferry::DumpSchemaJSON(program.get(), errorReporter.get(), output)) {
            return -1;
        }
        output.append("\n");
    } else {
        ferry::SchemaEmitter emitter(errorReporter);
        if (!emitter.emit(program.get(), output)) {
            return -1;
        }
    }

    if (FLAGS_outputFile.empty()) {
        std::cout << output;
        return 0;
    }

    std::ofstream outFile(FLAGS_outputFile, std::ofstream::binary);
    if (!outFile) {
        errorReporter->addFileOpenError(FLAGS_outputFile);
        return -1;
    }
    outFile << output;
    if (!outFile) {
        errorReporter->addError(ferry::ErrorReporter::kFileOpen, ferry::Location(),
                                fmt::format("Failed to write file '{}'.", FLAGS_outputFile));
        return -1;
    }

    SPDLOG_INFO("Wrote {} declarations to '{}'", program->declarations.size(), FLAGS_outputFile);
    return 0;
}
