#pragma once


namespace RankSort
{
    using data_t = int;

    // marks a result slot nobody has claimed yet, never a valid element
    inline constexpr data_t SENTINEL = -1;

    enum class DeviceKind
    {
        Gpu,
        Cpu,
        Any // first gpu, otherwise whatever the runtime picks
    };

}
