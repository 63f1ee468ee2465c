// main.cpp
#include "core/kernel.h"
#include "core/kernel_config.h"
#include "modules/control/control_surface.h"
#include "modules/executor/agent_invoker.h"
#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

// Runs a workflow file against the echo invoker and prints the final state,
// signatures and event trace.
int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 4) {
        std::cerr << "Usage: " << argv[0] << " <workflow.json|yaml> [kernel_config.json] [--manual]\n";
        return 1;
    }

    std::string config_path = "kernel_config.json";
    bool manual = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--manual") {
            manual = true;
        } else {
            config_path = arg;
        }
    }

    try {
        // 1. 配置与内核
        auto config = agentkernel::load_kernel_config(config_path);
        agentkernel::Kernel kernel(std::make_unique<agentkernel::EchoInvoker>(), config);
        agentkernel::ControlSurface control(kernel);

        // 2. 启动
        auto mode = manual ? agentkernel::DispatchMode::MANUAL : agentkernel::DispatchMode::AUTOMATIC;
        auto run_id = kernel.start_from_file(argv[1], mode);
        std::cout << "Started " << run_id << " (" << agentkernel::to_string(mode) << ")\n";

        // 3. manual: 按拓扑序逐个触发
        if (manual) {
            auto plan = kernel.runtime().plan(run_id);
            for (const auto& node_id : plan->order()) {
                auto response = control.handle("POST", "/runtime/agent/" + node_id + "/invoke?run_id=" + run_id);
                std::cout << "invoke " << node_id << " -> " << response.status << "\n";
            }
        }

        auto status = kernel.wait(run_id, std::chrono::minutes(10));

        // 4. 输出结果
        auto state = control.handle("GET", "/runtime/state?run_id=" + run_id);
        auto signatures = control.handle("GET", "/runtime/signatures?run_id=" + run_id);
        std::cout << (status == agentkernel::RunStatus::COMPLETED ? "[SUCCESS]\n" : "[FAILED]\n");
        std::cout << "State:\n" << state.body.dump(2) << "\n\n";
        std::cout << "Signatures:\n" << signatures.body.dump(2) << "\n";

        // 5. 导出 Trace
        auto events = control.handle("GET", "/runtime/events?run_id=" + run_id);
        std::ofstream trace_file("execution_trace.json");
        trace_file << events.body.dump(2) << std::endl;
        std::cout << "Trace exported to execution_trace.json ("
                  << events.body["events"].size() << " events)\n";

        return status == agentkernel::RunStatus::COMPLETED ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
