#include "quantum/qkd_types.h"
#include <algorithm>
#include <cctype>

namespace qkdsim {
namespace quantum {

static std::string lowered(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

const char* protocolToString(Protocol protocol) {
    switch (protocol) {
        case Protocol::BB84: return "BB84";
        case Protocol::E91: return "E91";
        case Protocol::BBM92: return "BBM92";
        case Protocol::TELEPORTATION: return "TELEPORTATION";
        default: return "UNKNOWN";
    }
}

bool parseProtocol(const std::string& name, Protocol& out) {
    std::string v = lowered(name);
    if (v == "bb84") out = Protocol::BB84;
    else if (v == "e91") out = Protocol::E91;
    else if (v == "bbm92") out = Protocol::BBM92;
    else if (v == "teleportation" || v == "teleport" || v == "teleportation-qkd") out = Protocol::TELEPORTATION;
    else return false;
    return true;
}

const char* basisToString(Basis basis) {
    switch (basis) {
        case Basis::RECTILINEAR: return "rectilinear";
        case Basis::ANGLE_22_5: return "22.5";
        case Basis::DIAGONAL: return "diagonal";
        case Basis::ANGLE_67_5: return "67.5";
        default: return "?";
    }
}

bool parseBasis(const std::string& name, Basis& out) {
    std::string v = lowered(name);
    if (v == "rectilinear" || v == "z" || v == "0") out = Basis::RECTILINEAR;
    else if (v == "diagonal" || v == "x" || v == "45") out = Basis::DIAGONAL;
    else if (v == "22.5") out = Basis::ANGLE_22_5;
    else if (v == "67.5") out = Basis::ANGLE_67_5;
    else return false;
    return true;
}

const char* runStateToString(RunState state) {
    switch (state) {
        case RunState::INIT: return "INIT";
        case RunState::PREPARING: return "PREPARING";
        case RunState::TRANSMITTING: return "TRANSMITTING";
        case RunState::DISCLOSING_BASES: return "DISCLOSING_BASES";
        case RunState::SIFTING: return "SIFTING";
        case RunState::ESTIMATING_ERROR: return "ESTIMATING_ERROR";
        case RunState::ACCEPTED: return "ACCEPTED";
        case RunState::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

}
}
