export module Synthesis;

export import :Classifier;
export import :Layers;
export import :ProceduralSynthesizer;
