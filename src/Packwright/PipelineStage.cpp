// =================================================================
// src/Packwright/PipelineStage.cpp
// =================================================================
// Implementation for stage names and ordering.

#include "Packwright/PipelineStage.hpp"
#include "Packwright/Errors.hpp"

namespace Packwright {

std::string stageName(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::SCAFFOLD: return "scaffold";
        case PipelineStage::POPULATE: return "populate";
        case PipelineStage::COMPILE: return "compile";
        case PipelineStage::EXECUTE: return "execute";
        case PipelineStage::PACKAGE: return "package";
        default: return "unknown";
    }
}

PipelineStage parseStage(const std::string& name) {
    for (PipelineStage stage : allStages()) {
        if (stageName(stage) == name) {
            return stage;
        }
    }
    throw UserError("Unknown pipeline stage '" + name + "'");
}

std::vector<PipelineStage> prerequisites(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::SCAFFOLD:
            return {};
        case PipelineStage::POPULATE:
            return {PipelineStage::SCAFFOLD};
        case PipelineStage::COMPILE:
            return {PipelineStage::SCAFFOLD, PipelineStage::POPULATE};
        case PipelineStage::EXECUTE:
        case PipelineStage::PACKAGE:
            return {PipelineStage::SCAFFOLD, PipelineStage::POPULATE, PipelineStage::COMPILE};
        default:
            return {};
    }
}

const std::vector<PipelineStage>& allStages() {
    static const std::vector<PipelineStage> stages = {
        PipelineStage::SCAFFOLD,
        PipelineStage::POPULATE,
        PipelineStage::COMPILE,
        PipelineStage::EXECUTE,
        PipelineStage::PACKAGE
    };
    return stages;
}

} // namespace Packwright
