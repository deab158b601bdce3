#pragma once
#include "Command.hpp"

class InfoCommand : public IndexCommand {
public:
    int run() override;

private:
    static InfoCommand instance; // Static instance to trigger registration
    InfoCommand(bool reg=false);

    friend class CmdTestBase<InfoCommand>;
};
