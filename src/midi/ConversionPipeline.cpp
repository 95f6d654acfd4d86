// ============================================================================
// File: src/midi/ConversionPipeline.cpp
// Version: 1.0.0
// Project: MidiBeat - Beat-addressed MIDI conversion toolkit
// ============================================================================

#include "ConversionPipeline.h"
#include "file/MidiFileReader.h"
#include "file/MidiFileWriter.h"
#include "representation/RepresentationSerializer.h"
#include "../core/Config.h"
#include "../core/Error.h"
#include "../core/Logger.h"

namespace midiBeat {

PipelineOptions PipelineOptions::fromConfig() {
    PipelineOptions options;
    options.builder = BuilderOptions::fromConfig();
    options.outputTicksPerBeat = Config::instance().getInt("conversion.output_ticks_per_beat", 0);
    return options;
}

ConversionPipeline::ConversionPipeline(PipelineOptions options)
    : options_(std::move(options))
{
}

// ============================================================================
// STEPS
// ============================================================================

MidiRepresentation ConversionPipeline::toRepresentation(const MidiFile& file) const {
    RepresentationBuilder builder(options_.builder);
    return builder.build(file);
}

MidiFile ConversionPipeline::toMidiFile(const MidiRepresentation& representation,
                                        int ticksPerBeat) const {
    RepresentationSerializer serializer(ticksPerBeat);
    return serializer.serialize(representation);
}

MidiRepresentation ConversionPipeline::applyFilter(MidiRepresentation representation,
                                                   const RepresentationFilter& filter) const {
    Logger::debug("ConversionPipeline", "Applying filter: " + filter.getName());
    return filter.apply(std::move(representation));
}

MidiRepresentation ConversionPipeline::applyFilter(MidiRepresentation representation,
                                                   const RepresentationTransform& transform) const {
    if (!transform) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT, "Empty transformation function");
    }
    Logger::debug("ConversionPipeline", "Applying custom transformation");
    return transform(std::move(representation));
}

// ============================================================================
// FILE CONVERSION
// ============================================================================

MidiRepresentation ConversionPipeline::processFile(const std::string& inputPath,
                                                   const std::string& outputPath,
                                                   const RepresentationFilter& filter) {
    return convert(inputPath, outputPath, filter.getName(),
                   [this, &filter](MidiRepresentation representation) {
                       return applyFilter(std::move(representation), filter);
                   });
}

MidiRepresentation ConversionPipeline::processFile(const std::string& inputPath,
                                                   const std::string& outputPath,
                                                   const RepresentationTransform& transform) {
    if (!transform) {
        MIDIBEAT_THROW(ErrorCode::INVALID_ARGUMENT, "Empty transformation function");
    }
    return convert(inputPath, outputPath, "custom",
                   [this, &transform](MidiRepresentation representation) {
                       return applyFilter(std::move(representation), transform);
                   });
}

MidiRepresentation ConversionPipeline::convert(const std::string& inputPath,
                                               const std::string& outputPath,
                                               const std::string& label,
                                               const RepresentationTransform& transform) {
    Logger::info("ConversionPipeline", "Converting " + inputPath + " -> " + outputPath +
                 " (" + label + ")");

    MidiFileReader reader;
    MidiFile input = reader.readFromFile(inputPath);

    MidiRepresentation representation = toRepresentation(input);
    Logger::debug("ConversionPipeline",
                  "Built " + std::to_string(representation.tracks.size()) + " tracks, " +
                  std::to_string(representation.noteCount()) + " notes");

    representation = transform(std::move(representation));

    int ticksPerBeat = options_.outputTicksPerBeat > 0
        ? options_.outputTicksPerBeat
        : input.ticksPerBeat();

    MidiFile output = toMidiFile(representation, ticksPerBeat);

    MidiFileWriter writer;
    writer.writeToFile(outputPath, output);

    Logger::info("ConversionPipeline",
                 "Wrote " + std::to_string(writer.getEventsWritten()) + " events (" +
                 std::to_string(writer.getBytesWritten()) + " bytes) at " +
                 std::to_string(ticksPerBeat) + " ticks per beat");

    return representation;
}

} // namespace midiBeat

// ============================================================================
// END OF FILE ConversionPipeline.cpp
// ============================================================================
