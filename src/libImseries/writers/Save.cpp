#include "Save.hpp"
#include "WriterRegistry.hpp"
#include "Hdf5Writer.hpp"
#include "FrameCacheWriter.hpp"
#include "core/Log.hpp"

namespace imseries {

void RegisterBuiltinWriters(WriterRegistry& registry) {
    registry.Register<Hdf5Writer>();
    registry.Register<FrameCacheWriter>();
}

void Write(const ImageSeries& series, const std::filesystem::path& filepath,
           StringView format, const Config& options) {
    const WriterFactory factory = WriterRegistry::Global().Resolve(format);

    UniquePtr<Writer> writer = factory(series, filepath, options);
    IMS_LOG_DEBUG("Writing {} frames as '{}' to {}", series.Length(), writer->Format(), filepath.string());
    writer->Write();
}

} // namespace imseries
