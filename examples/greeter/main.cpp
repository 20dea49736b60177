#include "common/Logger.h"
#include "engine/ProcessEngine.h"
#include "model/ProcessFactory.h"
#include "parsing/ProcessJsonParser.h"
#include <iostream>

namespace {

using PCE::Pattern;
using PCE::ProcessFactory;

// contract @"greeter"(name, ret) = { ret!("Hello, " ++ name) }
PCE::ProcessPtr greeterContract() {
    auto greeting = ProcessFactory::binary(PCE::BinaryOp::CONCAT, ProcessFactory::string("Hello, "),
                                           ProcessFactory::var("name"));
    return ProcessFactory::contract(ProcessFactory::channel("greeter"), {Pattern::bind("name"), Pattern::bind("ret")},
                                    ProcessFactory::send(ProcessFactory::var("ret"), {greeting}));
}

void printPending(const PCE::RunReport &report, const std::string &channelKey) {
    for (const auto &channel : report.channels) {
        if (channel.channel.key() != channelKey) {
            continue;
        }
        for (const auto &send : channel.sends) {
            std::cout << "  " << channelKey << " holds " << PCE::ValueUtils::payloadToString(send.payload) << "\n";
        }
    }
}

}  // namespace

int main() {
    PCE::LogOptions logOptions;
    logOptions.level = PCE::LogLevel::Warn;
    PCE::Logger::initialize(logOptions);

    std::cout << "=== Greeter Example ===" << "\n\n";

    // Option 1: the whole conversation inside one program
    std::cout << "Using run() on a closed program:" << "\n";
    {
        // new reply in { greeter | @"greeter"!("world", *reply) | for (msg <- reply) { @"out"!(msg) } }
        auto program = ProcessFactory::newNames(
            {"reply"},
            ProcessFactory::par(
                {greeterContract(),
                 ProcessFactory::send(ProcessFactory::channel("greeter"),
                                      {ProcessFactory::string("world"), ProcessFactory::var("reply")}),
                 ProcessFactory::receive(ProcessFactory::bind({Pattern::bind("msg")}, ProcessFactory::var("reply")),
                                         ProcessFactory::send(ProcessFactory::channel("out"),
                                                              {ProcessFactory::var("msg")}))}));

        PCE::ProcessEngine engine;
        engine.load(program);
        PCE::RunReport report = engine.run();

        std::cout << "  Status: " << PCE::toString(report.status) << " after " << report.steps << " steps\n";
        printPending(report, "@\"out\"");
    }

    std::cout << "\n";

    // Option 2: external callers inject requests and the engine is stepped by hand
    std::cout << "Using inject() and step():" << "\n";
    {
        PCE::ProcessEngine engine;
        engine.load(greeterContract());

        auto inbox = PCE::ValueUtils::fromChannel(PCE::ValueUtils::quote(PCE::ValueUtils::fromString("inbox")));
        engine.inject("greeter", {PCE::ValueUtils::fromString("Alice"), inbox});
        engine.inject("greeter", {PCE::ValueUtils::fromString("Bob"), inbox});

        size_t steps = 0;
        while (engine.step()) {
            ++steps;
        }

        PCE::RunReport report = engine.report();
        std::cout << "  Stepped " << steps << " times, status " << PCE::toString(report.status) << "\n";
        printPending(report, "@\"inbox\"");
    }

    std::cout << "\n";

    // Option 3: the program comes from a JSON document
    std::cout << "Using a program loaded from greeter.json:" << "\n";
    {
        PCE::ProcessJsonParser parser;
        auto program = parser.parseFile("greeter.json");
        if (!program) {
            for (const auto &message : parser.getErrorMessages()) {
                std::cerr << "  " << message << "\n";
            }
            return 1;
        }

        PCE::ProcessEngine engine;
        engine.load(program);
        PCE::InjectResult injected = engine.injectJson("greet", std::string(R"(["Carol"])"));
        if (!injected.isSuccess) {
            std::cerr << "  Injection rejected: " << injected.errorMessage << "\n";
            return 1;
        }
        PCE::RunReport report = engine.run();

        std::cout << "  Status: " << PCE::toString(report.status) << " after " << report.steps << " steps\n";
        printPending(report, "@\"out\"");
    }

    return 0;
}
