#include <memory>
#include <vector>

#include "benchmark/benchmark.h"
#include "gflags/gflags.h"
#include "glog/logging.h"

#include "airkit/air/coefficient_generator.h"
#include "airkit/air/mimc/mimc_air.h"
#include "airkit/algebra/fields/quadratic_extension_field_element.h"
#include "airkit/algebra/polynomials.h"
#include "airkit/composition_polynomial/constraint_evaluator.h"
#include "airkit/math/math.h"
#include "airkit/stl_utils/containers.h"
#include "airkit/utils/task_manager.h"

/*
  Measures the evaluation of the composition polynomial of MimcAir over a coset of the composition
  domain, which is the main cost of the constraint part of a prover. The argument is the log of
  the trace length.
  Run with --n_threads to set the number of threads of the TaskManager.
*/
namespace airkit {
namespace {

using ExtensionT = QuadraticExtensionFieldElement;

static void ConstraintEvaluationBenchmark(benchmark::State& state) {  // NOLINT
  const uint64_t trace_length = Pow2(state.range(0));
  const ProofParameters parameters(
      32, 8, 16, FieldExtension::kQuadratic, HashFunction::kBlake2s256);
  const std::unique_ptr<MimcAir> air = BuildAir<MimcAir>(
      TraceInfo(MimcAir::kNumColumns, trace_length),
      MimcAir::PublicInputs::Compute(BaseFieldElement::FromUint(5), trace_length), parameters);
  const AirContext& context = air->Context();

  const CoefficientGenerator generator(MakeByteArray<0xca, 0xfe, 0xca, 0xfe>());
  const ConstraintEvaluator<MimcAir, ExtensionT> evaluator(
      *air, generator.GetConstraintCompositionCoefficients<ExtensionT>(
                context.NumTransitionConstraints(), air->NumBoundaryConstraints()));

  // Trace low degree extension on the first coset.
  const uint64_t coset_size = context.CeDomainSize();
  const Trace trace = air->GetTrace();
  std::vector<std::vector<BaseFieldElement>> trace_evaluations;
  for (size_t i = 0; i < trace.Width(); ++i) {
    trace_evaluations.push_back(EvaluateOnCoset<BaseFieldElement>(
        InterpolateOnCoset<BaseFieldElement>(trace.GetColumn(i), BaseFieldElement::One()),
        coset_size, AirContext::DomainOffset()));
  }
  const std::vector<gsl::span<const BaseFieldElement>> trace_spans(
      trace_evaluations.begin(), trace_evaluations.end());
  std::vector<ExtensionT> evaluation = ExtensionT::UninitializedVector(coset_size);

  // NOLINTNEXTLINE: Suppressing warnings for unused variable '_'.
  for (auto _ : state) {
    evaluator.EvalOnCoset(AirContext::DomainOffset(), trace_spans, evaluation);
    benchmark::DoNotOptimize(evaluation.data());
  }
  state.SetItemsProcessed(state.iterations() * coset_size);
}

// NOLINTNEXTLINE: cppcoreguidelines-owning-memory.
BENCHMARK(ConstraintEvaluationBenchmark)->DenseRange(12, 18, 2)->Unit(benchmark::kMillisecond);

}  // namespace
}  // namespace airkit

int main(int argc, char** argv) {
  // Use " -- " to separate between the glog and the benchmark arguments.
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  ::benchmark::Initialize(&argc, argv);
  if (::benchmark::ReportUnrecognizedArguments(argc, argv)) {
    return 1;
  }
  LOG(INFO) << "Evaluating constraints with " << airkit::TaskManager::GetInstance().GetNumThreads()
            << " threads.";
  ::benchmark::RunSpecifiedBenchmarks();
  return 0;
}
