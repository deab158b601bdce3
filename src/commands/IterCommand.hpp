#pragma once
#include "Command.hpp"

class IterCommand : public IndexCommand {
public:
    int run() override;

private:
    static IterCommand instance; // Static instance to trigger registration
    IterCommand(bool reg=false);

    friend class CmdTestBase<IterCommand>;
};
