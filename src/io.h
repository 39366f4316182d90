#pragma once

#include "core.h"
#include "system.h"
#include <fstream>
#include <functional>
#include <iterator>
#include <optional>

namespace Particula {

/**
 * @brief Sequential and indexable store of `System` snapshots ("frames")
 *
 * Each frame is tagged with an integer simulation step. Frames are appended
 * with `write()` and retrieved by index or by iteration. Indices may be
 * negative, i.e. `-1` is the last frame. Read callbacks are applied in
 * registration order to every `System` before it is handed to the caller:
 *
 * ```{.cpp}
 *     TrajectoryXYZ trajectory("lattice.xyz", TrajectoryXYZ::Mode::READ);
 *     trajectory.addCallback(makeLatticeSites());
 *     for (const System& system : trajectory) {
 *         // ...
 *     }
 * ```
 */
class TrajectoryBase {
  public:
    using Callback = std::function<void(System&)>; //!< Transformation applied on read

    //! Forward iterator over all frames; a new `begin()` restarts from the first frame
    class Iterator {
        TrajectoryBase* trajectory = nullptr;
        size_t frame = 0;

      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = System;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = System;
        Iterator() = default;
        Iterator(TrajectoryBase* trajectory, size_t frame);
        System operator*() const;
        Iterator& operator++();
        Iterator operator++(int);
        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const;
    };

  private:
    std::vector<Callback> callbacks;
    size_t normalizeIndex(long index) const; //!< Map possibly negative index to frame number

  protected:
    std::vector<long> frame_steps; //!< Step of each frame in storage order
    virtual System loadFrame(size_t frame) = 0;                        //!< Read raw frame
    virtual void saveFrame(const System& system, long step) = 0;       //!< Append frame

  public:
    std::vector<std::string> fields = {"species", "position"}; //!< Particle attributes to store, in column order
    double timestep = 1.0;                                      //!< Time per step

    virtual ~TrajectoryBase() = default;
    const std::vector<long>& steps() const; //!< Step of each frame in order
    std::vector<double> times() const;      //!< Time of each frame, i.e. step times `timestep`
    size_t size() const;                    //!< Number of frames
    bool empty() const;
    void write(const System& system, long step); //!< Append frame
    System read(long index);                     //!< Frame at index with all callbacks applied
    System operator[](long index);               //!< Same as `read()`
    void addCallback(Callback callback);         //!< Register read callback
    virtual void close();                        //!< Flush and release resources
    Iterator begin();
    Iterator end();
};

/**
 * @brief Plain text trajectory in extended XYZ format
 *
 * Each frame is a flat record:
 *
 * ```
 *     4
 *     step:100 columns:species,position cell:5,5,5 dt:0.002
 *     A 0.5 -1.25 2
 *     ...
 * ```
 *
 * The metadata line is a whitespace separated list of `key:value` pairs. The
 * vector fields `position` and `velocity` span one column per dimension; all
 * other fields (`species`, `mass`, `radius`, `site` and any name from
 * `Particle::extra`) span one column. A null value is written as `-`.
 * Floating point numbers use the shortest representation that reads back
 * exactly.
 *
 * In write mode an existing file is truncated. In read mode a per-frame
 * offset index is built on construction and `FormatError` is thrown for
 * missing or malformed files. The file is closed when the object goes out
 * of scope.
 */
class TrajectoryXYZ : public TrajectoryBase {
  public:
    enum class Mode { READ, WRITE };

  private:
    //! Location of a frame in the file
    struct FrameIndex {
        std::streampos offset; //!< Byte offset of the particle count line
        size_t line;           //!< Line number (1-based) of the particle count line
    };
    std::string filename;
    Mode mode;
    std::ifstream input;
    std::ofstream output;
    std::vector<FrameIndex> frame_index;
    void buildIndex();
    System loadFrame(size_t frame) override;
    void saveFrame(const System& system, long step) override;

  public:
    TrajectoryXYZ(const std::string& filename, Mode mode);
    ~TrajectoryXYZ() override;
    TrajectoryXYZ(const TrajectoryXYZ&) = delete;
    TrajectoryXYZ& operator=(const TrajectoryXYZ&) = delete;
    const std::string& getFilename() const;
    void close() override;
};

/**
 * @brief Trajectory kept in memory
 *
 * Frames are stored as deep copies; reads return copies as well, so that
 * neither later modifications of the written system nor of a returned
 * frame affect the stored data.
 */
class TrajectoryRam : public TrajectoryBase {
    std::vector<System> frames;
    System loadFrame(size_t frame) override;
    void saveFrame(const System& system, long step) override;
};

/**
 * @brief Read-only view of a subset of the frames of another trajectory
 *
 * Frames `start`, `start + stride`, ... before `stop` are visible; `stop` is
 * clamped to the size of the source. Read callbacks of the source are applied
 * before those of the view.
 */
class TrajectorySliced : public TrajectoryBase {
    TrajectoryBase& source;
    std::vector<size_t> source_frames; //!< Source frame of each visible frame
    System loadFrame(size_t frame) override;
    void saveFrame(const System& system, long step) override;

  public:
    TrajectorySliced(TrajectoryBase& source, size_t start, size_t stop, size_t stride = 1);
};

/**
 * @brief Read-only view of a periodic trajectory with unfolded positions
 *
 * Folded positions are unfolded by accumulating minimum image displacements
 * between consecutive frames, starting from the positions of the first
 * frame. The displacement of a particle between two frames must therefore
 * be less than half a cell side. Frames are unfolded sequentially; reading
 * an earlier frame than the last one restarts from the first frame.
 *
 * ```{.cpp}
 *     TrajectoryXYZ folded("traj.xyz", TrajectoryXYZ::Mode::READ);
 *     TrajectoryUnfolded unfolded(folded);
 *     auto msd = unfolded[-1].meanSquareDisplacement(unfolded[0]);
 * ```
 */
class TrajectoryUnfolded : public TrajectoryBase {
    TrajectoryBase& source;
    std::optional<size_t> last_frame; //!< Last unfolded frame
    System last_folded;               //!< Source frame `last_frame`
    System last_unfolded;             //!< Unfolded frame `last_frame`
    void unfold(System& system) const;
    System loadFrame(size_t frame) override;
    void saveFrame(const System& system, long step) override;

  public:
    explicit TrajectoryUnfolded(TrajectoryBase& source);
};

/**
 * @brief Copy all frames, steps and timestep of a trajectory into another
 *
 * The destination adopts the `fields` and `timestep` of the source. Frames are
 * read with the read callbacks of the source applied.
 */
void convert(TrajectoryBase& source, TrajectoryBase& destination);

TrajectoryBase::Callback makeLatticeSites(); //!< Read callback: first position column as lattice site
TrajectoryBase::Callback clearVelocities();  //!< Read callback: set all velocities to null

} // namespace Particula
