#pragma once

namespace bamchop {

int chop(int argc, char* argv[]);

}  // namespace bamchop
