#pragma once

namespace chunkio {

// Owning file descriptor. Standard input is released but never closed.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;
    bool IsStdin() const;

    void Reset(int fd);
    int Release();
    // Returns the close(2) result, 0 when there was nothing to close.
    int Close();

  private:
    int fd_{-1};
};

} // namespace chunkio
