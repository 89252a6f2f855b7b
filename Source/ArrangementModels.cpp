/*
  ==============================================================================

    ArrangementModels.cpp

  ==============================================================================
*/

#include "ArrangementModels.h"

juce::String NoteTechnique::describe(juce::uint32 techniques)
{
    static const std::pair<juce::uint32, const char*> names[] =
    {
        { hammerOn, "HO" },        { pullOff, "PO" },          { slide, "SL" },
        { slideUnpitched, "SU" },  { bend, "BN" },             { vibrato, "VB" },
        { palmMute, "PM" },        { fretHandMute, "FM" },     { harmonic, "HA" },
        { pinchHarmonic, "PH" },   { tap, "TP" },              { slap, "SP" },
        { pluck, "PL" },           { tremolo, "TR" },          { accent, "AC" },
        { linkNext, "LN" },        { arpeggio, "AR" }
    };

    juce::StringArray parts;
    for (const auto& [bit, name] : names)
        if ((techniques & bit) != 0)
            parts.add(name);

    return parts.joinIntoString(" ");
}
