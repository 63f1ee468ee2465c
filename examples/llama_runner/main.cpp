// main.cpp
#include "core/kernel.h"
#include "core/kernel_config.h"
#include "modules/executor/llama_invoker.h"
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    if (argc != 3) {
        std::cerr << "Usage: " << argv[0] << " <workflow.json|yaml> <kernel_config.json>\n";
        return 1;
    }

    try {
        auto config = agentkernel::load_kernel_config(argv[2]);
        if (config.llm.model_path.empty() && config.llm.model_paths.empty()) {
            std::cerr << "kernel config has no llm.model_path\n";
            return 1;
        }
        agentkernel::Kernel kernel(std::make_unique<agentkernel::LlamaInvoker>(config.llm), config);

        auto run_id = kernel.start_from_file(argv[1]);
        auto status = kernel.wait(run_id);

        nlohmann::json state = kernel.snapshot(run_id);
        std::cout << state.dump(2) << "\n";
        return status == agentkernel::RunStatus::COMPLETED ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
