#include "cmd_artifact.h"
#include "cmd_replay.h"
#include "cmd_round.h"

#include "warden/config.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "warden_cli <round|serve|admit|verify|evaluate|task|replay|boost|pack|blacklist> ...\n";
        return 2;
    }
    warden::apply_profile_defaults(warden::detect_profile());

    std::string cmd = argv[1];
    if (cmd == "round") return cmd_round(argc, argv);
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "admit") return cmd_admit(argc, argv);
    if (cmd == "verify") return cmd_verify(argc, argv);
    if (cmd == "evaluate") return cmd_evaluate(argc, argv);
    if (cmd == "task") return cmd_task(argc, argv);
    if (cmd == "replay") return cmd_replay(argc, argv);
    if (cmd == "boost") return cmd_boost(argc, argv);
    if (cmd == "pack") return cmd_pack(argc, argv);
    if (cmd == "blacklist") return cmd_blacklist(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
