// The contents of this file are in the public domain. See LICENSE_FOR_EXAMPLE_PROGRAMS.txt
#include "multiview_sampler.h"
#include "errors.h"

#include <ctime>
#include <numeric>
#include <sstream>
#include <utility>

namespace relnet
{
    using namespace dlib;

    view_batch make_view_batch(
        const std::vector<multiview_sample>& samples
    )
    {
        if (samples.empty())
            throw degenerate_batch_error("can't build a view batch from zero samples");

        const size_t num_views = samples[0].views.size();
        if (num_views == 0)
            throw degenerate_batch_error("samples must hold at least one view");
        for (const auto& s : samples)
        {
            if (s.views.size() != num_views)
            {
                std::ostringstream sout;
                sout << "all samples of a batch must have " << num_views
                     << " views, found one with " << s.views.size();
                throw degenerate_batch_error(sout.str());
            }
        }

        view_batch batch;
        batch.num_views = num_views;
        batch.batch_size = samples.size();
        batch.images.reserve(num_views * samples.size());
        batch.labels.reserve(samples.size());
        // block v holds view v of every sample, in sample order
        for (size_t v = 0; v < num_views; ++v)
        {
            for (const auto& s : samples)
                batch.images.push_back(s.views[v]);
        }
        for (const auto& s : samples)
            batch.labels.push_back(s.label);
        return batch;
    }

// ----------------------------------------------------------------------------------------

    multiview_sampler::multiview_sampler(
        const std::vector<matrix<rgb_pixel>>& images_,
        const std::vector<unsigned long>& labels_,
        long num_views,
        augmentation_function augment_,
        unsigned long seed
    ) : images(images_), labels(labels_), views(num_views), augment(std::move(augment_)),
        rnd(static_cast<time_t>(seed))
    {
        if (num_views < 1)
            throw config_error("a multiview_sampler needs at least one view per image");
        if (!augment)
            throw config_error("the multi-view constructor needs an augmentation function");
        if (images.size() != labels.size())
            throw config_error("the image and label collections must have the same length");
    }

    multiview_sampler::multiview_sampler(
        const std::vector<matrix<rgb_pixel>>& images_,
        const std::vector<unsigned long>& labels_,
        unsigned long seed
    ) : images(images_), labels(labels_), views(1), rnd(static_cast<time_t>(seed))
    {
        if (images.size() != labels.size())
            throw config_error("the image and label collections must have the same length");
    }

    multiview_sample multiview_sampler::sample(
        size_t index
    )
    {
        if (index >= images.size())
        {
            std::ostringstream sout;
            sout << "sample index " << index << " is out of range, the source holds "
                 << images.size() << " images";
            throw dlib::error(sout.str());
        }

        multiview_sample result;
        result.label = labels[index];
        if (!augment)
        {
            result.views.push_back(images[index]);
            return result;
        }

        result.views.reserve(views);
        for (long v = 0; v < views; ++v)
            result.views.push_back(augment(images[index], rnd));
        return result;
    }

    view_batch multiview_sampler::sample_batch(
        const std::vector<size_t>& indices
    )
    {
        std::vector<multiview_sample> samples;
        samples.reserve(indices.size());
        for (auto idx : indices)
            samples.push_back(sample(idx));
        return make_view_batch(samples);
    }

    std::vector<std::vector<size_t>> multiview_sampler::epoch_batches(
        size_t batch_size
    )
    {
        DLIB_CASSERT(batch_size > 0);
        std::vector<size_t> order(images.size());
        std::iota(order.begin(), order.end(), 0);
        // Fisher-Yates with the sampler's own generator
        for (size_t i = order.size(); i > 1; --i)
            std::swap(order[i - 1], order[rnd.get_random_64bit_number() % i]);

        std::vector<std::vector<size_t>> batches(order.size() / batch_size);
        for (size_t b = 0; b < batches.size(); ++b)
            batches[b].assign(order.begin() + b * batch_size, order.begin() + (b + 1) * batch_size);
        return batches;
    }

// ----------------------------------------------------------------------------------------

    view_batch_loader::view_batch_loader(
        multiview_sampler& sampler_,
        size_t batch_size_,
        size_t tot_epochs_,
        size_t queue_depth
    ) :
        sampler(sampler_),
        batch_size(batch_size_),
        tot_epochs(tot_epochs_),
        num_batches(batch_size_ == 0 ? 0 : sampler_.size() / batch_size_),
        data(queue_depth)
    {
        if (batch_size == 0)
            throw config_error("view_batch_loader needs a positive batch size");
        worker = std::thread([this]() { thread(); });
    }

    view_batch_loader::~view_batch_loader()
    {
        // unblocks the loader thread if it is waiting on a full queue
        data.disable();
        if (worker.joinable())
            worker.join();
    }

    void view_batch_loader::thread()
    {
        loaded_batch item;
        try
        {
            for (size_t e = 0; e < tot_epochs && data.is_enabled(); ++e)
            {
                const auto batches = sampler.epoch_batches(batch_size);
                for (size_t b = 0; b < batches.size(); ++b)
                {
                    item.epoch = e;
                    item.index = b;
                    item.last = false;
                    item.batch = sampler.sample_batch(batches[b]);
                    if (!data.enqueue(item))
                        return;
                }
            }
        }
        catch (...)
        {
            // handed to the consumer by dequeue()
            error = std::current_exception();
        }

        item = loaded_batch();
        item.last = true;
        data.enqueue(item);
    }

    bool view_batch_loader::dequeue(
        loaded_batch& item
    )
    {
        if (finished)
            return false;
        if (!data.dequeue(item) || item.last)
        {
            finished = true;
            if (error)
                std::rethrow_exception(error);
            return false;
        }
        return true;
    }
}
