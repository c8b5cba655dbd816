#include "random.hh"

std::mt19937_64& nv::impl::thread_engine()
{
    thread_local auto engine = std::mt19937_64(std::random_device{}());
    return engine;
}
