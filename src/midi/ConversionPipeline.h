// ============================================================================
// File: src/midi/ConversionPipeline.h
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================
//
// Description:
//   Entry points tying the layers together:
//     MidiFile -> MidiRepresentation -> filter -> MidiFile -> .mid
//
// ============================================================================

#pragma once

#include <functional>
#include <string>

#include "file/MidiFileStructures.h"
#include "representation/MidiRepresentation.h"
#include "representation/RepresentationBuilder.h"
#include "filters/RepresentationFilter.h"

namespace midiBeat {

/// Plain-function transformation, for callers that do not need a named filter
using RepresentationTransform = std::function<MidiRepresentation(MidiRepresentation)>;

/**
 * @struct PipelineOptions
 */
struct PipelineOptions {
    BuilderOptions builder;
    int outputTicksPerBeat = 0;   ///< 0 = keep the input file's resolution

    /// Options from the "conversion" section of the global Config
    static PipelineOptions fromConfig();
};

/**
 * @class ConversionPipeline
 * @brief Read, build, filter, serialize, write
 *
 * Every step throws MidiBeatException on failure. processFile() encodes the
 * whole output before touching the output path, so a failing conversion
 * leaves no file behind.
 */
class ConversionPipeline {
public:
    explicit ConversionPipeline(PipelineOptions options = PipelineOptions());

    /// Raw event stream to beat-addressed representation
    MidiRepresentation toRepresentation(const MidiFile& file) const;

    /**
     * @brief Representation to raw event stream
     * @param ticksPerBeat Output resolution, 1..32767
     */
    MidiFile toMidiFile(const MidiRepresentation& representation, int ticksPerBeat) const;

    /// Run a filter; no validation beyond what the filter itself does
    MidiRepresentation applyFilter(MidiRepresentation representation,
                                   const RepresentationFilter& filter) const;

    MidiRepresentation applyFilter(MidiRepresentation representation,
                                   const RepresentationTransform& transform) const;

    /**
     * @brief Convert inputPath into outputPath through filter
     * @return The filtered representation that was written
     */
    MidiRepresentation processFile(const std::string& inputPath,
                                   const std::string& outputPath,
                                   const RepresentationFilter& filter);

    /// Same as above with a caller-supplied transformation
    MidiRepresentation processFile(const std::string& inputPath,
                                   const std::string& outputPath,
                                   const RepresentationTransform& transform);

    const PipelineOptions& getOptions() const { return options_; }

private:
    MidiRepresentation convert(const std::string& inputPath,
                               const std::string& outputPath,
                               const std::string& label,
                               const RepresentationTransform& transform);

    PipelineOptions options_;
};

} // namespace midiBeat

// ============================================================================
// END OF FILE ConversionPipeline.h
// ============================================================================
