#include <aeroinspect/app/inspection_runner_tbb.hpp>

#ifdef AEROINSPECT_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <cstddef>
#include <vector>

namespace aeroinspect::app {

void run_inspection_batch_tbb(InspectionService& service,
                              const std::vector<aeroinspect::core::Frame>& images,
                              const InspectionCallback& callback) {
  if (images.empty()) return;

  const std::size_t n = images.size();
  tbb::task_arena arena(static_cast<int>(service.governor().limit()));
  arena.execute([&] {
    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, n, 1),
        [&service, &images, &callback](const tbb::blocked_range<std::size_t>& range) {
          for (std::size_t i = range.begin(); i != range.end(); ++i) {
            auto outcome = service.submit(images[i]);
            if (callback) callback(i, outcome);
          }
        });
  });
}

}  // namespace aeroinspect::app

#endif  // AEROINSPECT_HAS_TBB
